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

// Protocol constants for CLSAG signatures.

#pragma once

#include <cstddef>

namespace clsag
{
namespace config
{
  const constexpr char CLSAG_FS_TRANSCRIPT_PREFIX[] = "clsag_FS_transcript";

  const constexpr char HASH_KEY_CLSAG_AGGREGATION_COEFFICIENT[] = "clsag_aggregation_coefficient";
  const constexpr char HASH_KEY_CLSAG_CHALLENGE_MESSAGE[] = "clsag_challenge_message";
  const constexpr char HASH_KEY_CLSAG_ROUND[] = "clsag_round";
  const constexpr char HASH_KEY_CLSAG_DETERMINISTIC_SCALAR[] = "clsag_deterministic_scalar";

  // a ring member beyond this count is rejected
  const constexpr std::size_t CLSAG_MAX_RING_SIZE = 1024;
  // a key set with more layers than this is rejected
  const constexpr std::size_t CLSAG_MAX_LAYERS = 16;
} //namespace config
} //namespace clsag
