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
#include "hash_functions.h"

//local headers
#include "misc_log_ex.h"
#include "ristretto_ops.h"

//third party headers
#include <sodium/crypto_core_ristretto255.h>
#include <sodium/crypto_generichash.h>

//standard headers
#include <cstring>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
namespace crypto
{
//-------------------------------------------------------------------------------------------------------------------
// H_x[k](data)
// - if derivation_key == nullptr, then the hash is NOT keyed
//-------------------------------------------------------------------------------------------------------------------
static void hash_base(const unsigned char *derivation_key,  //32 bytes
    const void *data,
    const std::size_t length,
    unsigned char *hash_out,
    const std::size_t out_length)
{
    init_backend();

    CHECK_AND_ASSERT_THROW_MES(crypto_generichash(hash_out,
                out_length,
                reinterpret_cast<const unsigned char*>(data),
                length,
                derivation_key,
                derivation_key ? 32 : 0) == 0,
        "hash_base: blake2b failed.");
}
//-------------------------------------------------------------------------------------------------------------------
// H_n[k](data): 64-byte hash then mod l
//-------------------------------------------------------------------------------------------------------------------
static void hash_to_scalar_base(const unsigned char *derivation_key,
    const void *data,
    const std::size_t length,
    unsigned char *hash_out)
{
    unsigned char temp[crypto_core_ristretto255_NONREDUCEDSCALARBYTES];
    hash_base(derivation_key, data, length, temp, sizeof(temp));
    crypto_core_ristretto255_scalar_reduce(hash_out, temp);  //mod l
    memwipe(temp, sizeof(temp));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void hash_to_32(const void *data, const std::size_t length, unsigned char *hash_out)
{
    hash_base(nullptr, data, length, hash_out, 32);
}
//-------------------------------------------------------------------------------------------------------------------
void hash_to_scalar(const void *data, const std::size_t length, unsigned char *hash_out)
{
    hash_to_scalar_base(nullptr, data, length, hash_out);
}
//-------------------------------------------------------------------------------------------------------------------
void derive_key(const unsigned char *derivation_key, const void *data, const std::size_t length, unsigned char *hash_out)
{
    CHECK_AND_ASSERT_THROW_MES(derivation_key, "derive_key: missing derivation key.");
    hash_to_scalar_base(derivation_key, data, length, hash_out);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace crypto
} //namespace clsag
