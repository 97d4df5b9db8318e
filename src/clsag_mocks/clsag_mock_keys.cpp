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

// NOT FOR PRODUCTION

//paired header
#include "clsag_mock_keys.h"

//local headers
#include "clsag/clsag_key_sets.h"
#include "clsag/clsag_ring.h"
#include "crypto/crypto_types.h"
#include "crypto/ristretto_ops.h"
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag.mocks"

namespace clsag
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
PrivateSet make_random_private_set(const std::size_t num_layers)
{
    crypto::keyV privkeys;
    privkeys.reserve(num_layers);

    for (std::size_t layer{0}; layer < num_layers; ++layer)
        privkeys.emplace_back(crypto::skGen());

    return make_private_set(std::move(privkeys));
}
//-------------------------------------------------------------------------------------------------------------------
PublicSet make_random_public_set(const std::size_t num_layers)
{
    crypto::keyV public_keys;
    public_keys.reserve(num_layers);

    for (std::size_t layer{0}; layer < num_layers; ++layer)
        public_keys.emplace_back(crypto::pkGen());

    return make_public_set(std::move(public_keys));
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<PublicSet> make_random_decoys(const std::size_t num_decoys, const std::size_t num_layers)
{
    std::vector<PublicSet> decoys;
    decoys.reserve(num_decoys);

    for (std::size_t i{0}; i < num_decoys; ++i)
        decoys.emplace_back(make_random_public_set(num_layers));

    return decoys;
}
//-------------------------------------------------------------------------------------------------------------------
void make_mock_ring(const std::size_t ring_size,
    const std::size_t num_layers,
    const std::size_t signer_index,
    ClsagRing &ring_out,
    PrivateSet &signer_out)
{
    CHECK_AND_ASSERT_THROW_MES(signer_index < ring_size, "make mock ring: signer index out of range.");

    ring_out = ClsagRing{};
    signer_out = make_random_private_set(num_layers);

    for (std::size_t i{0}; i < ring_size; ++i)
    {
        if (i == signer_index)
            ring_out.add_signer(signer_out);
        else
            ring_out.add_decoy(make_random_public_set(num_layers));
    }
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace clsag
