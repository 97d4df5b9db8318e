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
#include "scalar_source.h"

//local headers
#include "clsag/clsag_config.h"
#include "hash_functions.h"
#include "ristretto_ops.h"
#include "transcript.h"

//third party headers

//standard headers

namespace clsag
{
namespace crypto
{
//-------------------------------------------------------------------------------------------------------------------
void SodiumScalarSource::gen_scalar(key &scalar_out)
{
    skGen(scalar_out);
}
//-------------------------------------------------------------------------------------------------------------------
DeterministicScalarSource::DeterministicScalarSource(const key &seed) :
    m_seed{seed}
{}
//-------------------------------------------------------------------------------------------------------------------
DeterministicScalarSource::~DeterministicScalarSource()
{
    memwipe(m_seed.bytes, sizeof(key));
}
//-------------------------------------------------------------------------------------------------------------------
void DeterministicScalarSource::gen_scalar(key &scalar_out)
{
    // s = H_n[seed](counter), skipping the (negligible) zero outputs
    do
    {
        FSTranscript transcript{config::HASH_KEY_CLSAG_DETERMINISTIC_SCALAR, sizeof(m_counter)};
        transcript.append("counter", m_counter);
        ++m_counter;

        derive_key(m_seed.bytes, transcript.data(), transcript.size(), scalar_out.bytes);
    } while (!scalar_is_nonzero(scalar_out));
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace crypto
} //namespace clsag
