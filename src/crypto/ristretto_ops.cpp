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
#include "ristretto_ops.h"

//local headers
#include "crypto_types.h"
#include "misc_log_ex.h"

//third party headers
#include <sodium/core.h>
#include <sodium/crypto_core_ristretto255.h>
#include <sodium/crypto_hash_sha512.h>
#include <sodium/crypto_scalarmult_ristretto255.h>
#include <sodium/utils.h>

//standard headers
#include <cstring>
#include <stdexcept>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
namespace crypto
{
//-------------------------------------------------------------------------------------------------------------------
// result = scalar (the low 32 bytes of a 64-byte wide buffer are the scalar, the rest zero)
//-------------------------------------------------------------------------------------------------------------------
static void sc_widen(unsigned char (&wide_out)[crypto_core_ristretto255_NONREDUCEDSCALARBYTES], const key &s)
{
    memset(wide_out, 0, sizeof(wide_out));
    memcpy(wide_out, s.bytes, sizeof(key));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void init_backend()
{
    static const bool initialized{
            []() -> bool
            {
                // sodium_init() returns 1 if already initialized
                if (sodium_init() == -1)
                    throw std::runtime_error("clsag: failed to initialize libsodium");
                return true;
            }()
        };
    (void)initialized;
}
//-------------------------------------------------------------------------------------------------------------------
key zero()
{
    return key{};
}
//-------------------------------------------------------------------------------------------------------------------
key one()
{
    key temp{};
    temp.bytes[0] = 1;
    return temp;
}
//-------------------------------------------------------------------------------------------------------------------
key identity()
{
    return key{};
}
//-------------------------------------------------------------------------------------------------------------------
key get_G()
{
    static const key G{scalarmultBase(one())};
    return G;
}
//-------------------------------------------------------------------------------------------------------------------
key skGen()
{
    key sk;
    skGen(sk);
    return sk;
}
//-------------------------------------------------------------------------------------------------------------------
void skGen(key &sk_out)
{
    init_backend();

    do
    {
        crypto_core_ristretto255_scalar_random(sk_out.bytes);
    } while (!scalar_is_nonzero(sk_out));
}
//-------------------------------------------------------------------------------------------------------------------
key pkGen()
{
    key sk{skGen()};
    const key pk{scalarmultBase(sk)};
    memwipe(sk.bytes, sizeof(key));
    return pk;
}
//-------------------------------------------------------------------------------------------------------------------
bool point_is_valid(const key &P)
{
    init_backend();
    return crypto_core_ristretto255_is_valid_point(P.bytes) == 1;
}
//-------------------------------------------------------------------------------------------------------------------
bool point_is_identity(const key &P)
{
    return sodium_is_zero(P.bytes, sizeof(key)) == 1;
}
//-------------------------------------------------------------------------------------------------------------------
bool scalar_is_canonical(const key &s)
{
    // s is canonical iff it survives reduction unchanged
    unsigned char wide[crypto_core_ristretto255_NONREDUCEDSCALARBYTES];
    sc_widen(wide, s);

    key reduced;
    sc_reduce64(reduced, wide);

    const bool canonical{reduced == s};
    memwipe(wide, sizeof(wide));
    memwipe(reduced.bytes, sizeof(key));
    return canonical;
}
//-------------------------------------------------------------------------------------------------------------------
bool scalar_is_nonzero(const key &s)
{
    return sodium_is_zero(s.bytes, sizeof(key)) == 0;
}
//-------------------------------------------------------------------------------------------------------------------
key scalarmultBase(const key &a)
{
    key aG;
    scalarmultBase(aG, a);
    return aG;
}
//-------------------------------------------------------------------------------------------------------------------
void scalarmultBase(key &aG_out, const key &a)
{
    init_backend();

    // libsodium reports an identity result as failure; a zero scalar legitimately yields the identity
    if (crypto_scalarmult_ristretto255_base(aG_out.bytes, a.bytes) != 0)
        aG_out = identity();
}
//-------------------------------------------------------------------------------------------------------------------
key scalarmultKey(const key &P, const key &a)
{
    key aP;
    scalarmultKey(aP, P, a);
    return aP;
}
//-------------------------------------------------------------------------------------------------------------------
void scalarmultKey(key &aP_out, const key &P, const key &a)
{
    CHECK_AND_ASSERT_THROW_MES(point_is_valid(P), "scalarmultKey: invalid point encoding.");

    // the input point is valid, so a failure here means the product is the identity
    key temp;
    if (crypto_scalarmult_ristretto255(temp.bytes, a.bytes, P.bytes) != 0)
        temp = identity();

    aP_out = temp;
}
//-------------------------------------------------------------------------------------------------------------------
key addKeys(const key &A, const key &B)
{
    key AB;
    addKeys(AB, A, B);
    return AB;
}
//-------------------------------------------------------------------------------------------------------------------
void addKeys(key &AB_out, const key &A, const key &B)
{
    init_backend();

    key temp;
    CHECK_AND_ASSERT_THROW_MES(crypto_core_ristretto255_add(temp.bytes, A.bytes, B.bytes) == 0,
        "addKeys: invalid point encoding.");
    AB_out = temp;
}
//-------------------------------------------------------------------------------------------------------------------
void subKeys(key &AB_out, const key &A, const key &B)
{
    init_backend();

    key temp;
    CHECK_AND_ASSERT_THROW_MES(crypto_core_ristretto255_sub(temp.bytes, A.bytes, B.bytes) == 0,
        "subKeys: invalid point encoding.");
    AB_out = temp;
}
//-------------------------------------------------------------------------------------------------------------------
void addKeys_aGbP(key &aGbP_out, const key &a, const key &b, const key &P)
{
    key aG;
    key bP;
    scalarmultBase(aG, a);
    scalarmultKey(bP, P, b);
    addKeys(aGbP_out, aG, bP);
}
//-------------------------------------------------------------------------------------------------------------------
void addKeys_aAbB(key &aAbB_out, const key &a, const key &A, const key &b, const key &B)
{
    key aA;
    key bB;
    scalarmultKey(aA, A, a);
    scalarmultKey(bB, B, b);
    addKeys(aAbB_out, aA, bB);
}
//-------------------------------------------------------------------------------------------------------------------
key hash_to_point(const key &K)
{
    key point;
    hash_to_point(point, K.bytes, sizeof(key));
    return point;
}
//-------------------------------------------------------------------------------------------------------------------
void hash_to_point(key &point_out, const unsigned char *data, const std::size_t length)
{
    init_backend();

    unsigned char hash[crypto_hash_sha512_BYTES];
    crypto_hash_sha512(hash, data, length);

    static_assert(crypto_hash_sha512_BYTES == crypto_core_ristretto255_HASHBYTES, "");
    CHECK_AND_ASSERT_THROW_MES(crypto_core_ristretto255_from_hash(point_out.bytes, hash) == 0,
        "hash_to_point: mapping failed.");
}
//-------------------------------------------------------------------------------------------------------------------
void sc_add(key &s_out, const key &a, const key &b)
{
    crypto_core_ristretto255_scalar_add(s_out.bytes, a.bytes, b.bytes);
}
//-------------------------------------------------------------------------------------------------------------------
void sc_sub(key &s_out, const key &a, const key &b)
{
    crypto_core_ristretto255_scalar_sub(s_out.bytes, a.bytes, b.bytes);
}
//-------------------------------------------------------------------------------------------------------------------
void sc_mul(key &s_out, const key &a, const key &b)
{
    crypto_core_ristretto255_scalar_mul(s_out.bytes, a.bytes, b.bytes);
}
//-------------------------------------------------------------------------------------------------------------------
void sc_mulsub(key &s_out, const key &a, const key &b, const key &c)
{
    key ab;
    sc_mul(ab, a, b);
    sc_sub(s_out, c, ab);
    memwipe(ab.bytes, sizeof(key));
}
//-------------------------------------------------------------------------------------------------------------------
void sc_muladd(key &s_out, const key &a, const key &b, const key &c)
{
    key ab;
    sc_mul(ab, a, b);
    sc_add(s_out, ab, c);
    memwipe(ab.bytes, sizeof(key));
}
//-------------------------------------------------------------------------------------------------------------------
void sc_reduce64(key &s_out, const unsigned char *wide_input)
{
    crypto_core_ristretto255_scalar_reduce(s_out.bytes, wide_input);
}
//-------------------------------------------------------------------------------------------------------------------
void memwipe(void *ptr, const std::size_t length)
{
    sodium_memzero(ptr, length);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace crypto
} //namespace clsag
