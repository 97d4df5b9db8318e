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

// CLSAG signature type and its byte encoding.

#pragma once

//local headers
#include "crypto/crypto_types.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <cstddef>
#include <string>

//forward declarations
namespace clsag { namespace crypto { class TranscriptBuilder; } }

namespace clsag
{

////
// ClsagSignature
// - encoding: c_0 || s_0 || ... || s_{n-1} || I_0 || ... || I_{k-1} (32 bytes each)
// - the ring size n and layer count k are not encoded; a decoder must know them
///
struct ClsagSignature final
{
    /// challenge at ring index 0
    crypto::key c_0;
    /// responses, one per ring member
    crypto::keyV s;
    /// key images, one per layer
    crypto::keyV key_images;
};
inline const boost::string_ref container_name(const ClsagSignature&) { return "ClsagSignature"; }
void append_to_transcript(const ClsagSignature &container, crypto::TranscriptBuilder &transcript_inout);

bool operator==(const ClsagSignature &a, const ClsagSignature &b);
inline bool operator!=(const ClsagSignature &a, const ClsagSignature &b) { return !(a == b); }

/// size in bytes of an encoded signature for a ring of 'ring_size' members with 'num_layers' layers
std::size_t clsag_signature_size_bytes(const std::size_t ring_size, const std::size_t num_layers);

/**
* brief: serialize_clsag_signature - encode a signature
* param: signature -
* return: encoded bytes
*/
std::string serialize_clsag_signature(const ClsagSignature &signature);
/**
* brief: try_deserialize_clsag_signature - decode a signature
* param: blob - encoded bytes
* param: ring_size - expected number of responses
* param: num_layers - expected number of key images
* outparam: signature_out -
* return: false if the blob has the wrong size, or the ring size or layer count exceeds its maximum
* 
* note: point and scalar canonicity is not checked here (verification does that)
*/
bool try_deserialize_clsag_signature(const boost::string_ref blob,
    const std::size_t ring_size,
    const std::size_t num_layers,
    ClsagSignature &signature_out);

} //namespace clsag
