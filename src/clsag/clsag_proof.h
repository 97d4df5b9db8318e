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
// CLSAG: concise linkable spontaneous anonymous group signature over ristretto255.
// - a ring of n members, each a PublicSet of k keys: {P_{i,j}}
// - the signer at secret index l knows {x_j} with P_{l,j} = x_j G
// - key images: I_j = x_j H_p(P_{l,0}) (deterministic per private key, so reuse is linkable)
//
// proof outline
// 0. preliminaries
//    H_32(...) = blake2b(...) -> 32 bytes   hash to 32 bytes (domain separated)
//    H_n(...)  = H_64(...) mod l            hash to ristretto255 scalar (domain separated)
//    H_p(K)    = from_hash(sha512(K))       hash to ristretto255 point
// 1. aggregation
//    am   = H_32({{P}}, {I})                aggregation message
//    mu_j = H_n(am, j)                      aggregation coefficient per layer
//    P_i  = sum_j mu_j P_{i,j}
//    I    = sum_j mu_j I_j
//    x    = sum_j mu_j x_j
// 2. challenge chain
//    cm = H_32(m, {P_i}, I)                 challenge message
//    a = rand()                             signer nonce
//    c_{l+1} = H_n(cm, [a G], [a H_p(P_{l,0})])
//    for i = l+1, ..., l-1 (mod n):
//      s_i = rand()
//      c_{i+1} = H_n(cm, [s_i G + c_i P_i], [s_i H_p(P_{i,0}) + c_i I])
// 3. closure
//    s_l = a - c_l x
// 4. proof: {c_0, {s_i}, {I_j}}
//
// verification
// 1. recompute mu_j, P_i, I, cm
// 2. walk c_{i+1} = H_n(cm, [s_i G + c_i P_i], [s_i H_p(P_{i,0}) + c_i I]) from c_0
// 3. if (c_n == c_0) then the proof is valid
//
// note: the signing walk is a fixed loop over all n positions; the signer position is handled in the first step
//       by constant-time selection, so the loop's work does not depend on l
//
// References:
// - CLSAG (Brandon Goodell, Sarang Noether, Arthur Blue): https://eprint.iacr.org/2019/654
// - Zero to Monero 2 (koe, Kurt Alonso, Sarang Noether): Section 3.6
///

#pragma once

//local headers
#include "clsag_errors.h"
#include "clsag_key_sets.h"
#include "clsag_types.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <cstddef>
#include <vector>

//forward declarations
namespace clsag { namespace crypto { class ScalarSource; } }

namespace clsag
{

/**
* brief: make_clsag_signature - create a CLSAG signature
* param: message - message to insert in Fiat-Shamir transform hash
* param: ring - public key sets of the ring members, in ring order
* param: signer_index - l, index of the signer in the ring
* param: signer_privkeys - {x_j}, must derive ring[l]
* inoutparam: scalar_source - randomness for the nonce and the decoy responses
* return: the signature
* 
* throws ClsagException:
*   EMPTY_RING if the ring has no members
*   NO_SIGNER if the signer index is out of range or the private keys are missing
*   MISMATCHED_KEY_LENGTH if ring members have different layer counts
*   INVALID_ENCODING if a public key is not a valid point or a private key is not a reduced nonzero scalar
*   DUPLICATE_KEY if a key set repeats a key, or two ring members are identical
*   CRYPTO_BACKEND_ERROR if any group or hash operation fails
*/
ClsagSignature make_clsag_signature(const boost::string_ref message,
    const std::vector<PublicSet> &ring,
    const std::size_t signer_index,
    const PrivateSet &signer_privkeys,
    crypto::ScalarSource &scalar_source);
/**
* brief: check_clsag_signature - verify a CLSAG signature
* param: signature - signature to verify
* param: ring - public key sets of the ring members, in ring order
* param: message - message that was signed
* return: verification status (never throws)
* 
* note: key image uniqueness across signatures is not checked (see clsag_linkability.h)
*/
ClsagVerifyStatus check_clsag_signature(const ClsagSignature &signature,
    const std::vector<PublicSet> &ring,
    const boost::string_ref message);
/**
* brief: verify_clsag_signature - verify a CLSAG signature
* return: true if check_clsag_signature() returns ClsagVerifyStatus::VALID
*/
bool verify_clsag_signature(const ClsagSignature &signature,
    const std::vector<PublicSet> &ring,
    const boost::string_ref message);

} //namespace clsag
