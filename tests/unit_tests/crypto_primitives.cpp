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

#include "clsag/clsag_config.h"
#include "crypto/crypto_types.h"
#include "crypto/ct_utils.h"
#include "crypto/hash_functions.h"
#include "crypto/ristretto_ops.h"
#include "crypto/scalar_source.h"
#include "crypto/transcript.h"

#include "gtest/gtest.h"

#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_set>


//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static clsag::crypto::key transcript_challenge(const char *domain_separator,
    const char *label,
    const clsag::crypto::key &value)
{
    clsag::crypto::FSTranscript transcript{domain_separator, sizeof(clsag::crypto::key)};
    transcript.append(label, value);

    clsag::crypto::key challenge;
    clsag::crypto::hash_to_scalar(transcript, challenge.bytes);
    return challenge;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(crypto_primitives, group_ops)
{
    const clsag::crypto::key a{clsag::crypto::skGen()};
    const clsag::crypto::key b{clsag::crypto::skGen()};
    const clsag::crypto::key G{clsag::crypto::get_G()};

    // (a + b) G = a G + b G
    clsag::crypto::key a_plus_b;
    clsag::crypto::sc_add(a_plus_b, a, b);
    EXPECT_TRUE(clsag::crypto::scalarmultBase(a_plus_b) ==
        clsag::crypto::addKeys(clsag::crypto::scalarmultBase(a), clsag::crypto::scalarmultBase(b)));
    EXPECT_TRUE(clsag::crypto::scalarmultKey(G, a) == clsag::crypto::scalarmultBase(a));

    // c - a b
    clsag::crypto::key ab;
    clsag::crypto::key c_minus_ab;
    clsag::crypto::sc_mul(ab, a, b);
    clsag::crypto::sc_mulsub(c_minus_ab, a, b, clsag::crypto::one());
    clsag::crypto::key restored;
    clsag::crypto::sc_add(restored, c_minus_ab, ab);
    EXPECT_TRUE(restored == clsag::crypto::one());

    // zero scalars give the identity
    EXPECT_TRUE(clsag::crypto::point_is_identity(clsag::crypto::scalarmultBase(clsag::crypto::zero())));
    EXPECT_TRUE(clsag::crypto::point_is_identity(clsag::crypto::scalarmultKey(G, clsag::crypto::zero())));
    EXPECT_TRUE(clsag::crypto::point_is_valid(clsag::crypto::identity()));

    // P - P = identity
    clsag::crypto::key diff;
    clsag::crypto::subKeys(diff, G, G);
    EXPECT_TRUE(clsag::crypto::point_is_identity(diff));

    // invalid points are rejected
    clsag::crypto::key bad_point;
    memset(bad_point.bytes, 0xff, sizeof(bad_point));
    EXPECT_FALSE(clsag::crypto::point_is_valid(bad_point));
    EXPECT_ANY_THROW(clsag::crypto::scalarmultKey(bad_point, a));

    // scalar canonicity
    EXPECT_TRUE(clsag::crypto::scalar_is_canonical(a));
    EXPECT_TRUE(clsag::crypto::scalar_is_canonical(clsag::crypto::zero()));
    EXPECT_FALSE(clsag::crypto::scalar_is_canonical(bad_point));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(crypto_primitives, transcript)
{
    const clsag::crypto::key value{clsag::crypto::pkGen()};

    // deterministic
    EXPECT_TRUE(transcript_challenge("domain_a", "value", value) == transcript_challenge("domain_a", "value", value));

    // sensitive to domain separator, label, and value
    EXPECT_FALSE(transcript_challenge("domain_a", "value", value) == transcript_challenge("domain_b", "value", value));
    EXPECT_FALSE(transcript_challenge("domain_a", "value", value) == transcript_challenge("domain_a", "valuf", value));
    EXPECT_FALSE(transcript_challenge("domain_a", "value", value) ==
        transcript_challenge("domain_a", "value", clsag::crypto::pkGen()));

    // hash outputs are reduced scalars
    EXPECT_TRUE(clsag::crypto::scalar_is_canonical(transcript_challenge("domain_a", "value", value)));

    // lengths are framed: {"ab", "c"} != {"a", "bc"}
    clsag::crypto::TranscriptBuilder transcript_1{0};
    transcript_1.append("x", std::string{"ab"});
    transcript_1.append("y", std::string{"c"});
    clsag::crypto::TranscriptBuilder transcript_2{0};
    transcript_2.append("x", std::string{"a"});
    transcript_2.append("y", std::string{"bc"});
    ASSERT_EQ(transcript_1.size(), transcript_2.size());
    EXPECT_NE(memcmp(transcript_1.data(), transcript_2.data(), transcript_1.size()), 0);

    // large integers use multi-byte varints
    clsag::crypto::TranscriptBuilder transcript_small{0};
    transcript_small.append("n", std::uint64_t{1});
    clsag::crypto::TranscriptBuilder transcript_large{0};
    transcript_large.append("n", std::uint64_t{1} << 40);
    EXPECT_GT(transcript_large.size(), transcript_small.size());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(crypto_primitives, hash_to_point)
{
    const clsag::crypto::key K{clsag::crypto::pkGen()};
    const clsag::crypto::key H{clsag::crypto::hash_to_point(K)};

    EXPECT_TRUE(clsag::crypto::point_is_valid(H));
    EXPECT_TRUE(H == clsag::crypto::hash_to_point(K));
    EXPECT_FALSE(H == clsag::crypto::hash_to_point(clsag::crypto::pkGen()));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(crypto_primitives, ct_select)
{
    EXPECT_EQ(clsag::crypto::ct_equal_mask(0, 0), 0xff);
    EXPECT_EQ(clsag::crypto::ct_equal_mask(7, 7), 0xff);
    EXPECT_EQ(clsag::crypto::ct_equal_mask(7, 8), 0x00);
    EXPECT_EQ(clsag::crypto::ct_equal_mask(0, static_cast<std::size_t>(-1)), 0x00);
    EXPECT_EQ(clsag::crypto::ct_equal_mask(static_cast<std::size_t>(1) << 40, 0), 0x00);

    const clsag::crypto::key a{clsag::crypto::skGen()};
    const clsag::crypto::key b{clsag::crypto::skGen()};
    clsag::crypto::key out;

    clsag::crypto::ct_select(out, a, b, 0xff);
    EXPECT_TRUE(out == a);
    clsag::crypto::ct_select(out, a, b, 0x00);
    EXPECT_TRUE(out == b);

    // aliasing the output with an input
    out = a;
    clsag::crypto::ct_select(out, b, out, 0xff);
    EXPECT_TRUE(out == b);
    clsag::crypto::ct_select(out, a, out, 0x00);
    EXPECT_TRUE(out == b);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(crypto_primitives, scalar_sources)
{
    clsag::crypto::key seed;
    memset(seed.bytes, 1, sizeof(seed));

    clsag::crypto::DeterministicScalarSource source_1{seed};
    clsag::crypto::DeterministicScalarSource source_2{seed};

    // same seed: same stream; every draw is fresh, reduced, and nonzero
    std::unordered_set<clsag::crypto::key> seen;
    for (std::size_t i{0}; i < 20; ++i)
    {
        clsag::crypto::key s1;
        clsag::crypto::key s2;
        source_1.gen_scalar(s1);
        source_2.gen_scalar(s2);

        EXPECT_TRUE(s1 == s2);
        EXPECT_TRUE(clsag::crypto::scalar_is_canonical(s1));
        EXPECT_TRUE(clsag::crypto::scalar_is_nonzero(s1));
        EXPECT_TRUE(seen.insert(s1).second);
    }

    // different seed: different stream
    seed.bytes[0] = 2;
    clsag::crypto::DeterministicScalarSource source_3{seed};
    clsag::crypto::key s3;
    source_3.gen_scalar(s3);
    EXPECT_TRUE(seen.find(s3) == seen.end());

    // CSPRNG
    clsag::crypto::SodiumScalarSource sodium_source;
    clsag::crypto::key r1;
    clsag::crypto::key r2;
    sodium_source.gen_scalar(r1);
    sodium_source.gen_scalar(r2);
    EXPECT_FALSE(r1 == r2);
    EXPECT_TRUE(clsag::crypto::scalar_is_canonical(r1));
}
//-------------------------------------------------------------------------------------------------------------------
