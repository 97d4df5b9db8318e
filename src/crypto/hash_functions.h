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

// Core hash functions (BLAKE2b via libsodium).

#pragma once

//local headers

//third party headers

//standard headers
#include <cstddef>

//forward declarations


namespace clsag
{
namespace crypto
{

/// H_32(x): 32-byte output
void hash_to_32(const void *data, const std::size_t length, unsigned char *hash_out);
/// H_n(x): ristretto255 scalar output (32 bytes)
void hash_to_scalar(const void *data, const std::size_t length, unsigned char *hash_out);
/// H_n[k](x): ristretto255 scalar output (32 bytes); 32-byte key
void derive_key(const unsigned char *derivation_key, const void *data, const std::size_t length, unsigned char *hash_out);

/// transcript overloads (anything with .data() and .size())
template <typename TranscriptT>
void hash_to_scalar(const TranscriptT &transcript, unsigned char *hash_out)
{
    hash_to_scalar(transcript.data(), transcript.size(), hash_out);
}
template <typename TranscriptT>
void hash_to_32(const TranscriptT &transcript, unsigned char *hash_out)
{
    hash_to_32(transcript.data(), transcript.size(), hash_out);
}

} //namespace crypto
} //namespace clsag
