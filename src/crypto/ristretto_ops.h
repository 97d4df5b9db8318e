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

////
// Group and scalar operations on ristretto255 (thin layer over libsodium).
// - points are always stored as canonical 32-byte encodings
// - scalars are always stored reduced mod l
//
// notation
// - G: the ristretto255 basepoint
// - H_p(K): hash-to-point, from_hash(SHA-512(K)) (Elligator map, no known discrete log relative to G)
///

#pragma once

//local headers
#include "crypto_types.h"

//third party headers

//standard headers
#include <cstddef>

//forward declarations


namespace clsag
{
namespace crypto
{

/// initialize libsodium (idempotent, thread-safe); throws on failure
void init_backend();

/// zero scalar (also the identity point encoding)
key zero();
/// scalar 1
key one();
/// identity point
key identity();
/// basepoint G
key get_G();

/// random nonzero scalar from the libsodium CSPRNG
key skGen();
void skGen(key &sk_out);
/// random point (for test decoys)
key pkGen();

/// true if 'P' is a canonical ristretto255 encoding (the identity is a valid encoding)
bool point_is_valid(const key &P);
/// true if 'P' encodes the identity
bool point_is_identity(const key &P);
/// true if 's' is reduced mod l
bool scalar_is_canonical(const key &s);
/// true if 's' != 0
bool scalar_is_nonzero(const key &s);

/// aG = a * G (returns the identity for a == 0)
key scalarmultBase(const key &a);
void scalarmultBase(key &aG_out, const key &a);
/// aP = a * P (constant time in 'a'; throws if P is not a valid encoding)
key scalarmultKey(const key &P, const key &a);
void scalarmultKey(key &aP_out, const key &P, const key &a);
/// AB = A + B
key addKeys(const key &A, const key &B);
void addKeys(key &AB_out, const key &A, const key &B);
/// AB = A - B
void subKeys(key &AB_out, const key &A, const key &B);
/// aGbP = a*G + b*P
void addKeys_aGbP(key &aGbP_out, const key &a, const key &b, const key &P);
/// aAbB = a*A + b*B
void addKeys_aAbB(key &aAbB_out, const key &a, const key &A, const key &b, const key &B);

/// H_p(K)
key hash_to_point(const key &K);
void hash_to_point(key &point_out, const unsigned char *data, const std::size_t length);

/// s = a + b
void sc_add(key &s_out, const key &a, const key &b);
/// s = a - b
void sc_sub(key &s_out, const key &a, const key &b);
/// s = a * b
void sc_mul(key &s_out, const key &a, const key &b);
/// s = c - a*b
void sc_mulsub(key &s_out, const key &a, const key &b, const key &c);
/// s = a*b + c
void sc_muladd(key &s_out, const key &a, const key &b, const key &c);
/// s = 64-byte input mod l
void sc_reduce64(key &s_out, const unsigned char *wide_input);

/// zero out sensitive memory
void memwipe(void *ptr, const std::size_t length);

} //namespace crypto
} //namespace clsag
