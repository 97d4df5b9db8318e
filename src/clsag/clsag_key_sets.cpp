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
#include "clsag_key_sets.h"

//local headers
#include "clsag_config.h"
#include "clsag_errors.h"
#include "crypto/crypto_types.h"
#include "crypto/ristretto_ops.h"
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool keys_have_duplicates(crypto::keyV keys)
{
    std::sort(keys.begin(), keys.end());
    return std::adjacent_find(keys.begin(), keys.end()) != keys.end();
}
//-------------------------------------------------------------------------------------------------------------------
static void check_layer_count(const std::size_t num_layers)
{
    CLSAG_CHECK_AND_THROW(num_layers > 0, EMPTY_KEY_SET, "key set has no keys.");
    CLSAG_CHECK_AND_THROW(num_layers <= config::CLSAG_MAX_LAYERS, MISMATCHED_KEY_LENGTH,
        "key set has " + std::to_string(num_layers) + " layers (max " + std::to_string(config::CLSAG_MAX_LAYERS) + ").");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
PublicSet::PublicSet(crypto::keyV keys) :
    m_keys{std::move(keys)}
{}
//-------------------------------------------------------------------------------------------------------------------
bool PublicSet::duplicates_exist() const
{
    return keys_have_duplicates(m_keys);
}
//-------------------------------------------------------------------------------------------------------------------
crypto::key PublicSet::hashed_pubkey() const
{
    CHECK_AND_ASSERT_THROW_MES(!m_keys.empty(), "hashed pubkey: public set is empty.");
    return crypto::hash_to_point(m_keys[0]);
}
//-------------------------------------------------------------------------------------------------------------------
std::string PublicSet::to_bytes() const
{
    std::string bytes;
    bytes.reserve(m_keys.size() * sizeof(crypto::key));

    for (const crypto::key &public_key : m_keys)
        bytes.append(reinterpret_cast<const char*>(public_key.bytes), sizeof(crypto::key));

    return bytes;
}
//-------------------------------------------------------------------------------------------------------------------
const crypto::key& PublicSet::key_at(const std::size_t layer) const
{
    CHECK_AND_ASSERT_THROW_MES(layer < m_keys.size(), "public set: layer out of range.");
    return m_keys[layer];
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
PrivateSet::PrivateSet(crypto::keyV privkeys) :
    m_privkeys{std::move(privkeys)}
{}
//-------------------------------------------------------------------------------------------------------------------
PrivateSet::~PrivateSet()
{
    this->wipe();
}
//-------------------------------------------------------------------------------------------------------------------
PrivateSet& PrivateSet::operator=(const PrivateSet &other)
{
    if (this == &other)
        return *this;

    this->wipe();
    m_privkeys = other.m_privkeys;
    return *this;
}
//-------------------------------------------------------------------------------------------------------------------
PrivateSet& PrivateSet::operator=(PrivateSet &&other)
{
    if (this == &other)
        return *this;

    this->wipe();
    m_privkeys = std::move(other.m_privkeys);
    return *this;
}
//-------------------------------------------------------------------------------------------------------------------
crypto::keyV PrivateSet::compute_key_images(const crypto::key &generator) const
{
    crypto::keyV key_images;
    key_images.reserve(m_privkeys.size());

    for (const crypto::key &privkey : m_privkeys)
        key_images.emplace_back(crypto::scalarmultKey(generator, privkey));

    return key_images;
}
//-------------------------------------------------------------------------------------------------------------------
PublicSet PrivateSet::to_public_set() const
{
    crypto::keyV public_keys;
    public_keys.reserve(m_privkeys.size());

    for (const crypto::key &privkey : m_privkeys)
        public_keys.emplace_back(crypto::scalarmultBase(privkey));

    return PublicSet{std::move(public_keys)};
}
//-------------------------------------------------------------------------------------------------------------------
void PrivateSet::wipe()
{
    if (!m_privkeys.empty())
        crypto::memwipe(m_privkeys.data(), m_privkeys.size() * sizeof(crypto::key));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void validate_public_set(const PublicSet &public_set)
{
    check_layer_count(public_set.size());

    for (const crypto::key &public_key : public_set.keys())
    {
        CLSAG_CHECK_AND_THROW(crypto::point_is_valid(public_key), INVALID_ENCODING,
            "public key is not a canonical point encoding.");
        CLSAG_CHECK_AND_THROW(!crypto::point_is_identity(public_key), INVALID_ENCODING,
            "public key is the identity.");
    }

    CLSAG_CHECK_AND_THROW(!public_set.duplicates_exist(), DUPLICATE_KEY, "public set contains a duplicate key.");
}
//-------------------------------------------------------------------------------------------------------------------
PublicSet make_public_set(crypto::keyV keys)
{
    PublicSet public_set{std::move(keys)};
    validate_public_set(public_set);

    return public_set;
}
//-------------------------------------------------------------------------------------------------------------------
void validate_private_set(const PrivateSet &private_set)
{
    check_layer_count(private_set.size());

    for (const crypto::key &privkey : private_set.privkeys())
    {
        // the backend clears bit 255 in scalar mults, so an unreduced scalar would not match its public key
        CLSAG_CHECK_AND_THROW(crypto::scalar_is_canonical(privkey), INVALID_ENCODING,
            "private key is not a reduced scalar.");
        CLSAG_CHECK_AND_THROW(crypto::scalar_is_nonzero(privkey), INVALID_ENCODING, "private key is zero.");
    }

    // x_j != x_j' iff x_j G != x_j' G, so checking the public keys is enough
    CLSAG_CHECK_AND_THROW(!private_set.to_public_set().duplicates_exist(), DUPLICATE_KEY,
        "private set contains a duplicate key.");
}
//-------------------------------------------------------------------------------------------------------------------
void validate_ring_members(const std::vector<PublicSet> &ring)
{
    std::vector<std::string> member_bytes;
    member_bytes.reserve(ring.size());

    for (const PublicSet &member : ring)
        member_bytes.emplace_back(member.to_bytes());

    std::sort(member_bytes.begin(), member_bytes.end());
    CLSAG_CHECK_AND_THROW(std::adjacent_find(member_bytes.begin(), member_bytes.end()) == member_bytes.end(),
        DUPLICATE_KEY, "ring contains two identical members.");
}
//-------------------------------------------------------------------------------------------------------------------
PrivateSet make_private_set(crypto::keyV privkeys)
{
    // take ownership first so the scalars are wiped on every exit path
    PrivateSet private_set{std::move(privkeys)};
    validate_private_set(private_set);

    return private_set;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace clsag
