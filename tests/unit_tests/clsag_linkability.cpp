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

#include "clsag/clsag_key_sets.h"
#include "clsag/clsag_linkability.h"
#include "clsag/clsag_proof.h"
#include "clsag/clsag_ring.h"
#include "clsag/clsag_types.h"
#include "clsag_mocks/clsag_mock_keys.h"
#include "crypto/crypto_types.h"
#include "crypto/ristretto_ops.h"

#include "gtest/gtest.h"

#include <thread>
#include <vector>


//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_linkability, detect_reuse)
{
    const clsag::PrivateSet signer{clsag::mocks::make_random_private_set(2)};
    clsag::KeyImageStoreSimple key_image_store;

    // first signature
    clsag::ClsagRing ring_1;
    for (const clsag::PublicSet &decoy : clsag::mocks::make_random_decoys(4, 2))
        ring_1.add_decoy(decoy);
    ring_1.add_signer(signer);
    const clsag::ClsagSignature signature_1{ring_1.sign("first")};
    ASSERT_TRUE(clsag::verify_clsag_signature(signature_1, ring_1.public_keys(), "first"));

    EXPECT_FALSE(clsag::signature_is_linked(signature_1, key_image_store));
    EXPECT_TRUE(key_image_store.try_add_key_images(signature_1));
    EXPECT_EQ(key_image_store.num_key_images(), 2);
    EXPECT_TRUE(key_image_store.key_image_exists(signature_1.key_images[0]));
    EXPECT_TRUE(key_image_store.key_image_exists(signature_1.key_images[1]));

    // same signer, new ring and message: linked
    clsag::ClsagRing ring_2;
    ring_2.add_signer(signer);
    for (const clsag::PublicSet &decoy : clsag::mocks::make_random_decoys(2, 2))
        ring_2.add_decoy(decoy);
    const clsag::ClsagSignature signature_2{ring_2.sign("second")};
    ASSERT_TRUE(clsag::verify_clsag_signature(signature_2, ring_2.public_keys(), "second"));

    EXPECT_TRUE(clsag::signature_is_linked(signature_2, key_image_store));
    EXPECT_FALSE(key_image_store.try_add_key_images(signature_2));
    EXPECT_EQ(key_image_store.num_key_images(), 2);

    // a different signer is not linked
    clsag::ClsagRing ring_3;
    clsag::PrivateSet other_signer;
    clsag::mocks::make_mock_ring(3, 2, 0, ring_3, other_signer);
    const clsag::ClsagSignature signature_3{ring_3.sign("third")};

    EXPECT_FALSE(clsag::signature_is_linked(signature_3, key_image_store));
    EXPECT_TRUE(key_image_store.try_add_key_images(signature_3));
    EXPECT_EQ(key_image_store.num_key_images(), 4);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_linkability, partial_overlap_records_nothing)
{
    clsag::KeyImageStoreSimple key_image_store;
    const clsag::crypto::key KI_1{clsag::crypto::pkGen()};
    const clsag::crypto::key KI_2{clsag::crypto::pkGen()};
    const clsag::crypto::key KI_3{clsag::crypto::pkGen()};

    clsag::ClsagSignature signature_a;
    signature_a.key_images = {KI_1};
    EXPECT_TRUE(key_image_store.try_add_key_images(signature_a));

    // KI_1 is known, so KI_2 must not be recorded either
    clsag::ClsagSignature signature_b;
    signature_b.key_images = {KI_2, KI_1};
    EXPECT_FALSE(key_image_store.try_add_key_images(signature_b));
    EXPECT_FALSE(key_image_store.key_image_exists(KI_2));

    // repeated key images within one signature are rejected
    clsag::ClsagSignature signature_c;
    signature_c.key_images = {KI_3, KI_3};
    EXPECT_FALSE(key_image_store.try_add_key_images(signature_c));
    EXPECT_FALSE(key_image_store.key_image_exists(KI_3));

    EXPECT_EQ(key_image_store.num_key_images(), 1);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(clsag_linkability, concurrent_inserts)
{
    clsag::KeyImageStoreSimple key_image_store;

    clsag::ClsagSignature signature;
    signature.key_images = {clsag::crypto::pkGen(), clsag::crypto::pkGen()};

    // many threads race to record the same key images: exactly one wins
    std::vector<std::thread> threads;
    std::vector<char> results(8, 0);
    for (std::size_t i{0}; i < results.size(); ++i)
    {
        threads.emplace_back(
                [&key_image_store, &signature, &results, i]()
                {
                    results[i] = key_image_store.try_add_key_images(signature) ? 1 : 0;
                }
            );
    }
    for (std::thread &thread : threads)
        thread.join();

    std::size_t num_successes{0};
    for (const char result : results)
        num_successes += result;

    EXPECT_EQ(num_successes, 1);
    EXPECT_EQ(key_image_store.num_key_images(), 2);
}
//-------------------------------------------------------------------------------------------------------------------
