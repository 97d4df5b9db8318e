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

////
// Mock key sets and rings for unit testing
///

#pragma once

//local headers
#include "clsag/clsag_key_sets.h"
#include "clsag/clsag_ring.h"

//third party headers

//standard headers
#include <cstddef>
#include <vector>

//forward declarations


namespace clsag
{
namespace mocks
{

/// make a private set with 'num_layers' random keys
PrivateSet make_random_private_set(const std::size_t num_layers);
/// make a public set with 'num_layers' random keys (no known private keys)
PublicSet make_random_public_set(const std::size_t num_layers);
/// make 'num_decoys' random public sets with 'num_layers' keys each
std::vector<PublicSet> make_random_decoys(const std::size_t num_decoys, const std::size_t num_layers);
/**
* brief: make_mock_ring - make a ring of random decoys with a signer at the requested position
* param: ring_size - total number of members
* param: num_layers - keys per member
* param: signer_index - position of the signer in the ring
* outparam: ring_out - the ring
* outparam: signer_out - the signer's private keys
*/
void make_mock_ring(const std::size_t ring_size,
    const std::size_t num_layers,
    const std::size_t signer_index,
    ClsagRing &ring_out,
    PrivateSet &signer_out);

} //namespace mocks
} //namespace clsag
