// Copyright (c) 2022, The Monero Project
// 
// All rights reserved.
// 
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
// 
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
// 
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
// 
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

//paired header
#include "clsag_types.h"

//local headers
#include "clsag_config.h"
#include "crypto/crypto_types.h"
#include "crypto/transcript.h"
#include "misc_log_ex.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <cstring>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
//-------------------------------------------------------------------------------------------------------------------
static void append_key(const crypto::key &k, std::string &bytes_inout)
{
    bytes_inout.append(reinterpret_cast<const char*>(k.bytes), sizeof(crypto::key));
}
//-------------------------------------------------------------------------------------------------------------------
static void read_key(const char *&read_position_inout, crypto::key &k_out)
{
    memcpy(k_out.bytes, read_position_inout, sizeof(crypto::key));
    read_position_inout += sizeof(crypto::key);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void append_to_transcript(const ClsagSignature &container, crypto::TranscriptBuilder &transcript_inout)
{
    transcript_inout.append("c_0", container.c_0);
    transcript_inout.append("s", container.s);
    transcript_inout.append("KI", container.key_images);
}
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const ClsagSignature &a, const ClsagSignature &b)
{
    return a.c_0 == b.c_0 &&
        a.s == b.s &&
        a.key_images == b.key_images;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t clsag_signature_size_bytes(const std::size_t ring_size, const std::size_t num_layers)
{
    return (1 + ring_size + num_layers) * sizeof(crypto::key);
}
//-------------------------------------------------------------------------------------------------------------------
std::string serialize_clsag_signature(const ClsagSignature &signature)
{
    std::string bytes;
    bytes.reserve(clsag_signature_size_bytes(signature.s.size(), signature.key_images.size()));

    append_key(signature.c_0, bytes);
    for (const crypto::key &response : signature.s)
        append_key(response, bytes);
    for (const crypto::key &key_image : signature.key_images)
        append_key(key_image, bytes);

    return bytes;
}
//-------------------------------------------------------------------------------------------------------------------
bool try_deserialize_clsag_signature(const boost::string_ref blob,
    const std::size_t ring_size,
    const std::size_t num_layers,
    ClsagSignature &signature_out)
{
    CHECK_AND_ASSERT_MES(ring_size <= config::CLSAG_MAX_RING_SIZE, false,
        "clsag signature deserialize: ring size " << ring_size << " exceeds the maximum.");
    CHECK_AND_ASSERT_MES(num_layers <= config::CLSAG_MAX_LAYERS, false,
        "clsag signature deserialize: layer count " << num_layers << " exceeds the maximum.");
    CHECK_AND_ASSERT_MES(blob.size() == clsag_signature_size_bytes(ring_size, num_layers), false,
        "clsag signature deserialize: blob has size " << blob.size() << ", expected "
        << clsag_signature_size_bytes(ring_size, num_layers) << ".");

    const char *read_position{blob.data()};

    read_key(read_position, signature_out.c_0);

    signature_out.s.resize(ring_size);
    for (crypto::key &response : signature_out.s)
        read_key(read_position, response);

    signature_out.key_images.resize(num_layers);
    for (crypto::key &key_image : signature_out.key_images)
        read_key(read_position, key_image);

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace clsag
