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

////
// Scalar sources: injectable randomness for signing.
// - SodiumScalarSource: libsodium CSPRNG (use this in production)
// - DeterministicScalarSource: H_n[seed](domain || counter), reproducible output for tests
///

#pragma once

//local headers
#include "crypto_types.h"

//third party headers

//standard headers
#include <cstdint>

//forward declarations


namespace clsag
{
namespace crypto
{

////
// ScalarSource
// - produces uniformly distributed nonzero scalars
///
class ScalarSource
{
public:
//destructor
    virtual ~ScalarSource() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    ScalarSource& operator=(ScalarSource&&) = delete;

//member functions
    /// get a fresh nonzero scalar
    virtual void gen_scalar(key &scalar_out) = 0;
};

class SodiumScalarSource final : public ScalarSource
{
public:
    void gen_scalar(key &scalar_out) override;
};

class DeterministicScalarSource final : public ScalarSource
{
public:
//constructors
    explicit DeterministicScalarSource(const key &seed);

//destructor
    ~DeterministicScalarSource();

//member functions
    void gen_scalar(key &scalar_out) override;

//member variables
private:
    key m_seed;
    std::uint64_t m_counter{0};
};

} //namespace crypto
} //namespace clsag
