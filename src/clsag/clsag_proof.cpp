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
#include "clsag_proof.h"

//local headers
#include "clsag_config.h"
#include "clsag_errors.h"
#include "clsag_key_sets.h"
#include "clsag_types.h"
#include "crypto/crypto_types.h"
#include "crypto/ct_utils.h"
#include "crypto/hash_functions.h"
#include "crypto/ristretto_ops.h"
#include "crypto/scalar_source.h"
#include "crypto/transcript.h"
#include "misc_log_ex.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <exception>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
//-------------------------------------------------------------------------------------------------------------------
// aggregation coefficients 'mu_j', one per layer
//
// am   = H_32({{P}}, {I})
// mu_j = H_n(am, j)
//-------------------------------------------------------------------------------------------------------------------
static crypto::keyV compute_aggregation_coefficients(const std::vector<PublicSet> &ring, const crypto::keyV &key_images)
{
    const std::size_t num_layers{key_images.size()};

    // aggregation message: binds the whole ring and all key images
    crypto::key aggregation_message;
    {
        crypto::FSTranscript transcript{
                config::HASH_KEY_CLSAG_AGGREGATION_COEFFICIENT,
                (ring.size() + 1) * num_layers * sizeof(crypto::key)
            };
        transcript.append("ring_size", ring.size());
        for (const PublicSet &member : ring)
            transcript.append("P", member.keys());
        transcript.append("KI", key_images);

        crypto::hash_to_32(transcript, aggregation_message.bytes);
    }

    // one coefficient per layer
    crypto::keyV mu;
    mu.resize(num_layers);

    for (std::size_t layer{0}; layer < num_layers; ++layer)
    {
        crypto::FSTranscript transcript{config::HASH_KEY_CLSAG_AGGREGATION_COEFFICIENT, 2 * sizeof(crypto::key)};
        transcript.append("am", aggregation_message);
        transcript.append("layer", layer);

        crypto::hash_to_scalar(transcript, mu[layer].bytes);
        CHECK_AND_ASSERT_THROW_MES(crypto::scalar_is_nonzero(mu[layer]), "clsag aggregation coefficient: zero scalar.");
    }

    return mu;
}
//-------------------------------------------------------------------------------------------------------------------
// sum_j mu_j K_j
//-------------------------------------------------------------------------------------------------------------------
static crypto::key aggregate_keys(const crypto::keyV &keys, const crypto::keyV &mu)
{
    CHECK_AND_ASSERT_THROW_MES(keys.size() == mu.size(), "clsag aggregate keys: size mismatch.");

    crypto::key aggregate{crypto::identity()};
    crypto::key temp;

    for (std::size_t layer{0}; layer < keys.size(); ++layer)
    {
        crypto::scalarmultKey(temp, keys[layer], mu[layer]);
        crypto::addKeys(aggregate, aggregate, temp);
    }

    return aggregate;
}
//-------------------------------------------------------------------------------------------------------------------
// x = sum_j mu_j x_j
//-------------------------------------------------------------------------------------------------------------------
static void aggregate_privkeys(const crypto::keyV &privkeys, const crypto::keyV &mu, crypto::key &aggregate_out)
{
    CHECK_AND_ASSERT_THROW_MES(privkeys.size() == mu.size(), "clsag aggregate privkeys: size mismatch.");

    aggregate_out = crypto::zero();
    for (std::size_t layer{0}; layer < privkeys.size(); ++layer)
        crypto::sc_muladd(aggregate_out, mu[layer], privkeys[layer], aggregate_out);
}
//-------------------------------------------------------------------------------------------------------------------
// challenge message
//
// cm = H_32(m, {P_i}, I)
//-------------------------------------------------------------------------------------------------------------------
static crypto::key compute_challenge_message(const boost::string_ref message,
    const crypto::keyV &aggregate_ring_keys,
    const crypto::key &aggregate_key_image)
{
    crypto::FSTranscript transcript{
            config::HASH_KEY_CLSAG_CHALLENGE_MESSAGE,
            message.size() + (aggregate_ring_keys.size() + 1) * sizeof(crypto::key)
        };
    transcript.append("message", message);
    transcript.append("P", aggregate_ring_keys);
    transcript.append("I", aggregate_key_image);

    crypto::key challenge_message;
    crypto::hash_to_32(transcript, challenge_message.bytes);

    return challenge_message;
}
//-------------------------------------------------------------------------------------------------------------------
// challenge for the next ring position
//
// c_{i+1} = H_n(cm, L_i, R_i)
//-------------------------------------------------------------------------------------------------------------------
static void compute_round_challenge(const crypto::key &challenge_message,
    const crypto::key &L,
    const crypto::key &R,
    crypto::key &challenge_out)
{
    crypto::FSTranscript transcript{config::HASH_KEY_CLSAG_ROUND, 3 * sizeof(crypto::key)};
    transcript.append("cm", challenge_message);
    transcript.append("L", L);
    transcript.append("R", R);

    crypto::hash_to_scalar(transcript, challenge_out.bytes);
}
//-------------------------------------------------------------------------------------------------------------------
// L = s G + c P,  R = s H + c I
//-------------------------------------------------------------------------------------------------------------------
static void compute_round_points(const crypto::key &response,
    const crypto::key &challenge,
    const crypto::key &aggregate_ring_key,
    const crypto::key &hashed_pubkey,
    const crypto::key &aggregate_key_image,
    crypto::key &L_out,
    crypto::key &R_out)
{
    crypto::addKeys_aGbP(L_out, response, challenge, aggregate_ring_key);
    crypto::addKeys_aAbB(R_out, response, hashed_pubkey, challenge, aggregate_key_image);
}
//-------------------------------------------------------------------------------------------------------------------
// P_i = sum_j mu_j P_{i,j} for every ring member
//-------------------------------------------------------------------------------------------------------------------
static crypto::keyV aggregate_ring_keys(const std::vector<PublicSet> &ring, const crypto::keyV &mu)
{
    crypto::keyV aggregate_keys_out;
    aggregate_keys_out.reserve(ring.size());

    for (const PublicSet &member : ring)
        aggregate_keys_out.emplace_back(aggregate_keys(member.keys(), mu));

    return aggregate_keys_out;
}
//-------------------------------------------------------------------------------------------------------------------
// H_p(P_{i,0}) for every ring member
//-------------------------------------------------------------------------------------------------------------------
static crypto::keyV hashed_ring_pubkeys(const std::vector<PublicSet> &ring)
{
    crypto::keyV hashed_pubkeys;
    hashed_pubkeys.reserve(ring.size());

    for (const PublicSet &member : ring)
        hashed_pubkeys.emplace_back(member.hashed_pubkey());

    return hashed_pubkeys;
}
//-------------------------------------------------------------------------------------------------------------------
static ClsagSignature make_clsag_signature_impl(const boost::string_ref message,
    const std::vector<PublicSet> &ring,
    const std::size_t signer_index,
    const PrivateSet &signer_privkeys,
    crypto::ScalarSource &scalar_source)
{
    const std::size_t ring_size{ring.size()};
    const std::size_t num_layers{signer_privkeys.size()};

    // 1. key images: I_j = x_j H_p(P_{l,0})
    ClsagSignature signature;
    signature.key_images = signer_privkeys.compute_key_images(ring[signer_index].hashed_pubkey());

    // 2. aggregation
    const crypto::keyV mu{compute_aggregation_coefficients(ring, signature.key_images)};
    const crypto::keyV aggregate_keys_P{aggregate_ring_keys(ring, mu)};
    const crypto::key aggregate_key_image{aggregate_keys(signature.key_images, mu)};
    const crypto::keyV hashed_pubkeys{hashed_ring_pubkeys(ring)};

    crypto::key aggregate_privkey;
    aggregate_privkeys(signer_privkeys.privkeys(), mu, aggregate_privkey);

    const crypto::key challenge_message{
            compute_challenge_message(message, aggregate_keys_P, aggregate_key_image)
        };

    // 3. nonce and responses (every position gets a random response, the signer's is overwritten at the end)
    crypto::key alpha;
    scalar_source.gen_scalar(alpha);

    signature.s.resize(ring_size);
    for (crypto::key &response : signature.s)
        scalar_source.gen_scalar(response);

    // 4. challenge walk: n uniform steps starting at the signer
    // - step 0 (i == l) uses s = alpha and c = 0, so L = alpha G and R = alpha H_p(P_{l,0})
    // - after step t the running challenge is c_{i+1}
    crypto::key challenge{crypto::zero()};
    crypto::key challenge_0{crypto::zero()};
    crypto::key response_effective;
    crypto::key challenge_effective;
    crypto::key L;
    crypto::key R;

    for (std::size_t step{0}; step < ring_size; ++step)
    {
        const std::size_t i{(signer_index + step) % ring_size};
        const std::size_t next_i{(i + 1) % ring_size};
        const unsigned char is_signer_mask{crypto::ct_equal_mask(i, signer_index)};

        crypto::ct_select(response_effective, alpha, signature.s[i], is_signer_mask);
        crypto::ct_select(challenge_effective, crypto::zero(), challenge, is_signer_mask);

        compute_round_points(response_effective,
            challenge_effective,
            aggregate_keys_P[i],
            hashed_pubkeys[i],
            aggregate_key_image,
            L,
            R);
        compute_round_challenge(challenge_message, L, R, challenge);

        crypto::ct_select(challenge_0, challenge, challenge_0, crypto::ct_equal_mask(next_i, 0));
    }

    // 5. closure: the walk ends on c_l, so s_l = alpha - c_l x
    crypto::sc_mulsub(signature.s[signer_index], challenge, aggregate_privkey, alpha);
    signature.c_0 = challenge_0;

    crypto::memwipe(alpha.bytes, sizeof(crypto::key));
    crypto::memwipe(aggregate_privkey.bytes, sizeof(crypto::key));
    crypto::memwipe(response_effective.bytes, sizeof(crypto::key));

    MDEBUG("Made clsag signature (ring size: " << ring_size << ", layers: " << num_layers << ").");

    return signature;
}
//-------------------------------------------------------------------------------------------------------------------
static ClsagVerifyStatus check_signature_shape(const ClsagSignature &signature, const std::vector<PublicSet> &ring)
{
    if (ring.empty() || ring.size() > config::CLSAG_MAX_RING_SIZE)
        return ClsagVerifyStatus::LENGTH_MISMATCH;

    const std::size_t num_layers{ring[0].size()};
    if (num_layers == 0 || num_layers > config::CLSAG_MAX_LAYERS)
        return ClsagVerifyStatus::LENGTH_MISMATCH;

    for (const PublicSet &member : ring)
    {
        if (member.size() != num_layers)
            return ClsagVerifyStatus::LENGTH_MISMATCH;
    }

    if (signature.s.size() != ring.size() ||
        signature.key_images.size() != num_layers)
        return ClsagVerifyStatus::LENGTH_MISMATCH;

    return ClsagVerifyStatus::VALID;
}
//-------------------------------------------------------------------------------------------------------------------
static ClsagVerifyStatus check_signature_encodings(const ClsagSignature &signature, const std::vector<PublicSet> &ring)
{
    if (!crypto::scalar_is_canonical(signature.c_0))
        return ClsagVerifyStatus::INVALID_ENCODING;

    for (const crypto::key &response : signature.s)
    {
        if (!crypto::scalar_is_canonical(response))
            return ClsagVerifyStatus::INVALID_ENCODING;
    }

    for (const crypto::key &key_image : signature.key_images)
    {
        if (!crypto::point_is_valid(key_image) || crypto::point_is_identity(key_image))
            return ClsagVerifyStatus::INVALID_ENCODING;
    }

    for (const PublicSet &member : ring)
    {
        for (const crypto::key &public_key : member.keys())
        {
            if (!crypto::point_is_valid(public_key) || crypto::point_is_identity(public_key))
                return ClsagVerifyStatus::INVALID_ENCODING;
        }
    }

    return ClsagVerifyStatus::VALID;
}
//-------------------------------------------------------------------------------------------------------------------
static ClsagVerifyStatus check_clsag_signature_impl(const ClsagSignature &signature,
    const std::vector<PublicSet> &ring,
    const boost::string_ref message)
{
    const ClsagVerifyStatus shape_status{check_signature_shape(signature, ring)};
    if (shape_status != ClsagVerifyStatus::VALID)
        return shape_status;

    const ClsagVerifyStatus encoding_status{check_signature_encodings(signature, ring)};
    if (encoding_status != ClsagVerifyStatus::VALID)
        return encoding_status;

    // 1. aggregation
    const crypto::keyV mu{compute_aggregation_coefficients(ring, signature.key_images)};
    const crypto::keyV aggregate_keys_P{aggregate_ring_keys(ring, mu)};
    const crypto::key aggregate_key_image{aggregate_keys(signature.key_images, mu)};
    const crypto::key challenge_message{
            compute_challenge_message(message, aggregate_keys_P, aggregate_key_image)
        };

    // 2. walk the ring from c_0
    crypto::key challenge{signature.c_0};
    crypto::key L;
    crypto::key R;

    for (std::size_t i{0}; i < ring.size(); ++i)
    {
        compute_round_points(signature.s[i],
            challenge,
            aggregate_keys_P[i],
            ring[i].hashed_pubkey(),
            aggregate_key_image,
            L,
            R);
        compute_round_challenge(challenge_message, L, R, challenge);
    }

    // 3. the chain must close
    if (challenge != signature.c_0)
        return ClsagVerifyStatus::CHALLENGE_MISMATCH;

    return ClsagVerifyStatus::VALID;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
ClsagSignature make_clsag_signature(const boost::string_ref message,
    const std::vector<PublicSet> &ring,
    const std::size_t signer_index,
    const PrivateSet &signer_privkeys,
    crypto::ScalarSource &scalar_source)
{
    // input checks
    CLSAG_CHECK_AND_THROW(ring.size() > 0, EMPTY_RING, "cannot sign with an empty ring.");
    CLSAG_CHECK_AND_THROW(ring.size() <= config::CLSAG_MAX_RING_SIZE, LENGTH_MISMATCH, "ring is too large.");
    CLSAG_CHECK_AND_THROW(signer_index < ring.size(), NO_SIGNER, "signer index is outside the ring.");
    CLSAG_CHECK_AND_THROW(!signer_privkeys.empty(), NO_SIGNER, "signer private keys are missing.");
    validate_private_set(signer_privkeys);

    for (const PublicSet &member : ring)
    {
        validate_public_set(member);
        CLSAG_CHECK_AND_THROW(member.size() == signer_privkeys.size(), MISMATCHED_KEY_LENGTH,
            "ring member layer count does not match the signer's.");
    }
    validate_ring_members(ring);

    try
    {
        CLSAG_CHECK_AND_THROW(signer_privkeys.to_public_set() == ring[signer_index], NO_SIGNER,
            "signer private keys do not match the ring member at the signer index.");

        return make_clsag_signature_impl(message, ring, signer_index, signer_privkeys, scalar_source);
    }
    catch (const ClsagException&)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw_clsag_error(ClsagError::ErrorCode::CRYPTO_BACKEND_ERROR, e.what());
    }
}
//-------------------------------------------------------------------------------------------------------------------
ClsagVerifyStatus check_clsag_signature(const ClsagSignature &signature,
    const std::vector<PublicSet> &ring,
    const boost::string_ref message)
{
    ClsagVerifyStatus status;

    try
    {
        status = check_clsag_signature_impl(signature, ring, message);
    }
    catch (const std::exception &e)
    {
        // the encodings were checked up front, so this should be unreachable with a working backend
        MERROR("clsag verification failed in the backend: " << e.what());
        status = ClsagVerifyStatus::INVALID_ENCODING;
    }

    if (status != ClsagVerifyStatus::VALID)
        MWARNING("Rejected clsag signature: " << verify_status_to_string(status) << ".");

    return status;
}
//-------------------------------------------------------------------------------------------------------------------
bool verify_clsag_signature(const ClsagSignature &signature,
    const std::vector<PublicSet> &ring,
    const boost::string_ref message)
{
    return check_clsag_signature(signature, ring, message) == ClsagVerifyStatus::VALID;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace clsag
