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

// Ring assembly for CLSAG signing.

#pragma once

//local headers
#include "clsag_key_sets.h"
#include "clsag_types.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/utility/string_ref.hpp>

//standard headers
#include <cstddef>
#include <vector>

//forward declarations
namespace clsag { namespace crypto { class ScalarSource; } }

namespace clsag
{

////
// ClsagRingMember
// - a decoy (public keys only) or the signer (private keys set, public keys derived from them)
///
struct ClsagRingMember final
{
    /// public keys of the member (optional for a signer; if set, must match the derived keys)
    PublicSet public_set;
    /// private keys if this member is the signer
    boost::optional<PrivateSet> private_set;
};

////
// ClsagRing
// - ordered ring members with equal layer counts and distinct key sets
// - at most one signer; its position is not observable through this interface
// - a failed add leaves the ring unchanged
///
class ClsagRing final
{
public:
//member functions
    /// add a member; throws ClsagException (see add_decoy() and add_signer())
    /// - INVALID_ENCODING if a signer entry carries public keys that its private keys do not derive
    void add_member(ClsagRingMember member);
    /**
    * brief: add_decoy - append a decoy member
    * param: decoy - public keys of the decoy
    * 
    * throws ClsagException:
    *   EMPTY_KEY_SET, INVALID_ENCODING, DUPLICATE_KEY if the set is invalid (see validate_public_set())
    *   MISMATCHED_KEY_LENGTH if the layer count differs from existing members
    *   DUPLICATE_KEY if an existing member has the same public keys
    *   LENGTH_MISMATCH if the ring is full
    */
    void add_decoy(PublicSet decoy);
    /**
    * brief: add_signer - append the signer
    * param: signer_privkeys - private keys of the signer
    * 
    * throws ClsagException:
    *   MULTIPLE_SIGNERS if the ring already has a signer
    *   EMPTY_KEY_SET, INVALID_ENCODING, DUPLICATE_KEY if the private keys are invalid (see validate_private_set())
    *   otherwise as add_decoy() for the derived public keys
    */
    void add_signer(PrivateSet signer_privkeys);

    std::size_t size() const { return m_members.size(); }
    /// layer count shared by all members (0 for an empty ring)
    std::size_t num_layers() const { return m_members.empty() ? 0 : m_members[0].size(); }
    bool has_signer() const { return static_cast<bool>(m_signer_index); }
    /// member public keys in ring order
    const std::vector<PublicSet>& public_keys() const { return m_members; }

    /**
    * brief: sign - sign a message with the ring
    * param: message -
    * inoutparam: scalar_source - randomness for the signature
    * return: the signature
    * 
    * throws ClsagException:
    *   EMPTY_RING if the ring has no members
    *   NO_SIGNER if no signer was added
    *   CRYPTO_BACKEND_ERROR on a backend failure
    */
    ClsagSignature sign(const boost::string_ref message, crypto::ScalarSource &scalar_source) const;
    /// sign with the libsodium CSPRNG
    ClsagSignature sign(const boost::string_ref message) const;

private:
    void check_new_member(const PublicSet &public_set) const;

//member variables
    std::vector<PublicSet> m_members;
    PrivateSet m_signer_privkeys;
    boost::optional<std::size_t> m_signer_index;
};

} //namespace clsag
