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

// Basic 32-byte types for ristretto255 points and scalars.

#pragma once

//local headers

//third party headers
#include <sodium/crypto_verify_32.h>

//standard headers
#include <cstddef>
#include <cstring>
#include <functional>
#include <vector>

//forward declarations


namespace clsag
{
namespace crypto
{

////
// key
// - a canonical ristretto255 point encoding or a little-endian scalar mod l
// - the identity point and the zero scalar are both encoded as 32 zero bytes
///
struct key
{
    unsigned char& operator[](const int i) { return bytes[i]; }
    unsigned char operator[](const int i) const { return bytes[i]; }
    bool operator==(const key &other) const { return !crypto_verify_32(bytes, other.bytes); }
    bool operator!=(const key &other) const { return !(*this == other); }

    unsigned char bytes[32];
};
using keyV = std::vector<key>;

/// lexicographical byte order (for sorting, not for secrets)
inline bool operator<(const key &a, const key &b) { return memcmp(a.bytes, b.bytes, sizeof(key)) < 0; }

} //namespace crypto
} //namespace clsag

namespace std
{
template <>
struct hash<clsag::crypto::key>
{
    std::size_t operator()(const clsag::crypto::key &k) const
    {
        // points and hash outputs are uniformly distributed, so the first bytes are a sufficient hash
        static_assert(sizeof(clsag::crypto::key) >= sizeof(std::size_t), "key too small for hashing");
        std::size_t result;
        memcpy(&result, k.bytes, sizeof(std::size_t));
        return result;
    }
};
} //namespace std
