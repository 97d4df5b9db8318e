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
// Key sets for CLSAG ring members.
// - a PublicSet is one ring member's vector of public keys, one per layer
// - a PrivateSet is the signer's matching vector of private keys: P_j = x_j G
// - layer 0 is the primary key; its hash-to-point H_p(P_0) is the key image base
///

#pragma once

//local headers
#include "crypto/crypto_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <string>
#include <vector>

//forward declarations


namespace clsag
{

////
// PublicSet
// - canonical point encodings in layer order
// - sets made with make_public_set() are non-empty, duplicate-free, and contain no identity points
///
class PublicSet final
{
public:
//constructors
    PublicSet() = default;
    /// lenient constructor: wraps keys without validation
    explicit PublicSet(crypto::keyV keys);

//overloaded operators
    bool operator==(const PublicSet &other) const { return m_keys == other.m_keys; }
    bool operator!=(const PublicSet &other) const { return !(*this == other); }

//member functions
    std::size_t size() const { return m_keys.size(); }
    bool empty() const { return m_keys.empty(); }

    /// true if two layers have the same encoding
    bool duplicates_exist() const;
    /// H_p(P_0): throws if the set is empty
    crypto::key hashed_pubkey() const;
    /// P_0 || P_1 || ... || P_{k-1}
    std::string to_bytes() const;

    const crypto::keyV& keys() const { return m_keys; }
    const crypto::key& key_at(const std::size_t layer) const;

//member variables
private:
    crypto::keyV m_keys;
};

////
// PrivateSet
// - canonical nonzero scalars in layer order
// - wiped on destruction
///
class PrivateSet final
{
public:
//constructors
    PrivateSet() = default;
    /// lenient constructor: wraps scalars without validation (signers re-check with validate_private_set())
    explicit PrivateSet(crypto::keyV privkeys);
    PrivateSet(const PrivateSet&) = default;
    PrivateSet(PrivateSet&&) = default;

//destructor
    ~PrivateSet();

//overloaded operators
    PrivateSet& operator=(const PrivateSet &other);
    PrivateSet& operator=(PrivateSet &&other);

//member functions
    std::size_t size() const { return m_privkeys.size(); }
    bool empty() const { return m_privkeys.empty(); }

    /// {x_j * generator}_j in layer order
    crypto::keyV compute_key_images(const crypto::key &generator) const;
    /// {x_j * G}_j in layer order
    PublicSet to_public_set() const;

    const crypto::keyV& privkeys() const { return m_privkeys; }

//member variables
private:
    void wipe();

    crypto::keyV m_privkeys;
};

/**
* brief: validate_public_set - check that a public key set may be used as a ring member
* param: public_set -
* 
* throws ClsagException:
*   EMPTY_KEY_SET if the set is empty
*   MISMATCHED_KEY_LENGTH if the set has more than config::CLSAG_MAX_LAYERS keys
*   INVALID_ENCODING if a key is not a canonical point, or is the identity
*   DUPLICATE_KEY if two layers have the same key
*/
void validate_public_set(const PublicSet &public_set);
/**
* brief: validate_private_set - check that a private key set may be used by a signer
* param: private_set -
* 
* throws ClsagException:
*   EMPTY_KEY_SET, MISMATCHED_KEY_LENGTH as for validate_public_set()
*   INVALID_ENCODING if a scalar is not reduced, or is zero
*   DUPLICATE_KEY if two layers have the same scalar
*/
void validate_private_set(const PrivateSet &private_set);
/**
* brief: validate_ring_members - check that no two ring members have the same public keys
* param: ring - public key sets of the ring members
* 
* throws ClsagException:
*   DUPLICATE_KEY if two members are identical
*/
void validate_ring_members(const std::vector<PublicSet> &ring);
/**
* brief: make_public_set - build a validated public key set
* param: keys - point encodings in layer order
* return: public key set
*/
PublicSet make_public_set(crypto::keyV keys);
/**
* brief: make_private_set - build a validated private key set
* param: privkeys - scalars in layer order
* return: private key set
* 
* throws ClsagException: see validate_private_set()
*/
PrivateSet make_private_set(crypto::keyV privkeys);

} //namespace clsag
