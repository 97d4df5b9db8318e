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

// Constant-time helpers for secret-dependent selection.

#pragma once

//local headers
#include "crypto_types.h"

//third party headers

//standard headers
#include <climits>
#include <cstddef>

//forward declarations


namespace clsag
{
namespace crypto
{

/// 0xFF if a == b, 0x00 otherwise (no branches on the inputs)
inline unsigned char ct_equal_mask(const std::size_t a, const std::size_t b)
{
    const std::size_t diff{a ^ b};
    // top bit of (diff | -diff) is set iff diff != 0
    const std::size_t is_nonzero{(diff | (~diff + 1)) >> (sizeof(std::size_t) * CHAR_BIT - 1)};
    return static_cast<unsigned char>(0u - static_cast<unsigned int>(is_nonzero ^ 1));
}

/// out = mask ? if_set : if_unset (mask must be 0xFF or 0x00); out may alias either input
inline void ct_select(key &out, const key &if_set, const key &if_unset, const unsigned char mask)
{
    for (std::size_t i{0}; i < sizeof(key); ++i)
    {
        out.bytes[i] = static_cast<unsigned char>((if_set.bytes[i] & mask) |
            (if_unset.bytes[i] & static_cast<unsigned char>(~mask)));
    }
}

} //namespace crypto
} //namespace clsag
