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

#include "clsag/clsag_errors.h"
#include "clsag/clsag_key_sets.h"
#include "clsag_mocks/clsag_mock_keys.h"
#include "crypto/crypto_types.h"
#include "crypto/ristretto_ops.h"

#include "gtest/gtest.h"

#include <cstring>
#include <string>
#include <vector>


//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
template <typename F>
static bool throws_clsag_error(F &&func, const clsag::ClsagError::ErrorCode expected_code)
{
    try
    {
        func();
    }
    catch (const clsag::ClsagException &e)
    {
        return e.code() == expected_code;
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_key_sets, private_to_public)
{
    const clsag::crypto::key x0{clsag::crypto::skGen()};
    const clsag::crypto::key x1{clsag::crypto::skGen()};
    const clsag::PrivateSet private_set{clsag::make_private_set({x0, x1})};

    const clsag::PublicSet public_set{private_set.to_public_set()};
    ASSERT_EQ(public_set.size(), 2);
    EXPECT_TRUE(public_set.key_at(0) == clsag::crypto::scalarmultBase(x0));
    EXPECT_TRUE(public_set.key_at(1) == clsag::crypto::scalarmultBase(x1));

    // to_public_set() is deterministic
    EXPECT_TRUE(private_set.to_public_set() == public_set);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_key_sets, duplicates_exist)
{
    const clsag::crypto::key K0{clsag::crypto::pkGen()};
    const clsag::crypto::key K1{clsag::crypto::pkGen()};
    const clsag::crypto::key K2{clsag::crypto::pkGen()};

    EXPECT_FALSE(clsag::PublicSet(clsag::crypto::keyV{K0}).duplicates_exist());
    EXPECT_FALSE(clsag::PublicSet(clsag::crypto::keyV{K0, K1, K2}).duplicates_exist());
    EXPECT_TRUE(clsag::PublicSet(clsag::crypto::keyV{K0, K0}).duplicates_exist());
    EXPECT_TRUE(clsag::PublicSet(clsag::crypto::keyV{K0, K1, K0}).duplicates_exist());
    EXPECT_TRUE(clsag::PublicSet(clsag::crypto::keyV{K2, K1, K1}).duplicates_exist());

    // private sets with a repeated scalar derive duplicate public keys
    const clsag::crypto::key x{clsag::crypto::skGen()};
    EXPECT_TRUE(clsag::PrivateSet(clsag::crypto::keyV{x, x}).to_public_set().duplicates_exist());
    EXPECT_TRUE(throws_clsag_error([&]{ clsag::make_private_set({x, x}); },
        clsag::ClsagError::ErrorCode::DUPLICATE_KEY));
    EXPECT_TRUE(throws_clsag_error([&]{ clsag::make_public_set({K0, K1, K0}); },
        clsag::ClsagError::ErrorCode::DUPLICATE_KEY));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_key_sets, hashed_pubkey)
{
    const clsag::PublicSet public_set{clsag::mocks::make_random_public_set(3)};

    // H_p(P_0) is deterministic and depends only on the first key
    const clsag::crypto::key hashed{public_set.hashed_pubkey()};
    EXPECT_TRUE(hashed == public_set.hashed_pubkey());
    EXPECT_TRUE(hashed == clsag::crypto::hash_to_point(public_set.key_at(0)));

    const clsag::PublicSet same_first_key{clsag::crypto::keyV{public_set.key_at(0), clsag::crypto::pkGen()}};
    EXPECT_TRUE(hashed == same_first_key.hashed_pubkey());

    // it is a valid point distinct from the key itself and from G
    EXPECT_TRUE(clsag::crypto::point_is_valid(hashed));
    EXPECT_FALSE(clsag::crypto::point_is_identity(hashed));
    EXPECT_FALSE(hashed == public_set.key_at(0));
    EXPECT_FALSE(hashed == clsag::crypto::get_G());

    // different first keys give different hashed keys
    EXPECT_FALSE(hashed == clsag::mocks::make_random_public_set(3).hashed_pubkey());

    EXPECT_ANY_THROW(clsag::PublicSet{}.hashed_pubkey());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_key_sets, key_images)
{
    const clsag::PrivateSet private_set{clsag::mocks::make_random_private_set(2)};
    const clsag::crypto::key generator{private_set.to_public_set().hashed_pubkey()};

    const clsag::crypto::keyV key_images{private_set.compute_key_images(generator)};
    ASSERT_EQ(key_images.size(), 2);
    EXPECT_TRUE(key_images[0] == clsag::crypto::scalarmultKey(generator, private_set.privkeys()[0]));
    EXPECT_TRUE(key_images[1] == clsag::crypto::scalarmultKey(generator, private_set.privkeys()[1]));

    // same keys, same generator: same images
    EXPECT_TRUE(key_images == private_set.compute_key_images(generator));
    // key images are not the public keys
    EXPECT_FALSE(key_images == private_set.to_public_set().keys());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_key_sets, to_bytes)
{
    const clsag::PublicSet public_set{clsag::mocks::make_random_public_set(3)};
    const std::string bytes{public_set.to_bytes()};

    ASSERT_EQ(bytes.size(), 3 * sizeof(clsag::crypto::key));
    for (std::size_t layer{0}; layer < 3; ++layer)
    {
        EXPECT_EQ(memcmp(bytes.data() + layer * sizeof(clsag::crypto::key),
            public_set.key_at(layer).bytes,
            sizeof(clsag::crypto::key)), 0);
    }

    EXPECT_TRUE(clsag::PublicSet{}.to_bytes().empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_key_sets, construction_rejections)
{
    using ErrorCode = clsag::ClsagError::ErrorCode;

    // empty
    EXPECT_TRUE(throws_clsag_error([]{ clsag::make_public_set({}); }, ErrorCode::EMPTY_KEY_SET));
    EXPECT_TRUE(throws_clsag_error([]{ clsag::make_private_set({}); }, ErrorCode::EMPTY_KEY_SET));

    // identity public key
    EXPECT_TRUE(throws_clsag_error([]{ clsag::make_public_set({clsag::crypto::pkGen(), clsag::crypto::identity()}); },
        ErrorCode::INVALID_ENCODING));

    // non-canonical point encoding
    clsag::crypto::key bad_point;
    memset(bad_point.bytes, 0xff, sizeof(bad_point));
    EXPECT_FALSE(clsag::crypto::point_is_valid(bad_point));
    EXPECT_TRUE(throws_clsag_error([&]{ clsag::make_public_set({bad_point}); }, ErrorCode::INVALID_ENCODING));

    // zero and unreduced scalars
    EXPECT_TRUE(throws_clsag_error([]{ clsag::make_private_set({clsag::crypto::zero()}); },
        ErrorCode::INVALID_ENCODING));
    clsag::crypto::key unreduced_scalar;
    memset(unreduced_scalar.bytes, 0xff, sizeof(unreduced_scalar));
    EXPECT_FALSE(clsag::crypto::scalar_is_canonical(unreduced_scalar));
    EXPECT_TRUE(throws_clsag_error([&]{ clsag::make_private_set({unreduced_scalar}); }, ErrorCode::INVALID_ENCODING));

    // too many layers
    EXPECT_TRUE(throws_clsag_error([]{ clsag::mocks::make_random_private_set(17); },
        ErrorCode::MISMATCHED_KEY_LENGTH));

    // valid inputs pass
    EXPECT_NO_THROW(clsag::make_public_set({clsag::crypto::pkGen(), clsag::crypto::pkGen()}));
    EXPECT_NO_THROW(clsag::make_private_set({clsag::crypto::skGen(), clsag::crypto::skGen()}));
}
//-------------------------------------------------------------------------------------------------------------------
