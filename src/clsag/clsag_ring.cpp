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
#include "clsag_ring.h"

//local headers
#include "clsag_config.h"
#include "clsag_errors.h"
#include "clsag_key_sets.h"
#include "clsag_proof.h"
#include "clsag_types.h"
#include "crypto/scalar_source.h"
#include "misc_log_ex.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <algorithm>
#include <utility>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
//-------------------------------------------------------------------------------------------------------------------
void ClsagRing::check_new_member(const PublicSet &public_set) const
{
    validate_public_set(public_set);

    CLSAG_CHECK_AND_THROW(m_members.size() < config::CLSAG_MAX_RING_SIZE, LENGTH_MISMATCH,
        "ring is full (max " + std::to_string(config::CLSAG_MAX_RING_SIZE) + " members).");

    if (!m_members.empty())
    {
        CLSAG_CHECK_AND_THROW(public_set.size() == this->num_layers(), MISMATCHED_KEY_LENGTH,
            "new member has " + std::to_string(public_set.size()) + " layers, ring has "
            + std::to_string(this->num_layers()) + ".");
    }

    CLSAG_CHECK_AND_THROW(std::find(m_members.begin(), m_members.end(), public_set) == m_members.end(),
        DUPLICATE_KEY, "ring already contains this member.");
}
//-------------------------------------------------------------------------------------------------------------------
void ClsagRing::add_member(ClsagRingMember member)
{
    if (member.private_set)
    {
        CLSAG_CHECK_AND_THROW(member.public_set.empty() || member.public_set == member.private_set->to_public_set(),
            INVALID_ENCODING, "signer public keys do not match its private keys.");
        this->add_signer(std::move(*member.private_set));
    }
    else
        this->add_decoy(std::move(member.public_set));
}
//-------------------------------------------------------------------------------------------------------------------
void ClsagRing::add_decoy(PublicSet decoy)
{
    this->check_new_member(decoy);

    m_members.emplace_back(std::move(decoy));
    MDEBUG("Added decoy to clsag ring (ring size: " << m_members.size() << ").");
}
//-------------------------------------------------------------------------------------------------------------------
void ClsagRing::add_signer(PrivateSet signer_privkeys)
{
    CLSAG_CHECK_AND_THROW(!m_signer_index, MULTIPLE_SIGNERS, "ring already has a signer.");
    validate_private_set(signer_privkeys);

    PublicSet signer_pubkeys{signer_privkeys.to_public_set()};
    this->check_new_member(signer_pubkeys);

    // all checks passed: commit
    m_members.emplace_back(std::move(signer_pubkeys));
    m_signer_privkeys = std::move(signer_privkeys);
    m_signer_index = m_members.size() - 1;
    MDEBUG("Added signer to clsag ring (ring size: " << m_members.size() << ").");
}
//-------------------------------------------------------------------------------------------------------------------
ClsagSignature ClsagRing::sign(const boost::string_ref message, crypto::ScalarSource &scalar_source) const
{
    CLSAG_CHECK_AND_THROW(!m_members.empty(), EMPTY_RING, "cannot sign with an empty ring.");
    CLSAG_CHECK_AND_THROW(m_signer_index, NO_SIGNER, "ring has no signer.");

    return make_clsag_signature(message, m_members, *m_signer_index, m_signer_privkeys, scalar_source);
}
//-------------------------------------------------------------------------------------------------------------------
ClsagSignature ClsagRing::sign(const boost::string_ref message) const
{
    crypto::SodiumScalarSource scalar_source;
    return this->sign(message, scalar_source);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace clsag
