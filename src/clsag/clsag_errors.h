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

// Error objects for reporting problems with CLSAG key sets, rings, and signatures.
// NOTE: The error message is declared last so it can be ignored when using designated initialization.

#pragma once

//local headers

//third party headers

//standard headers
#include <stdexcept>
#include <string>

//forward declarations


namespace clsag
{

struct ClsagError final
{
    enum class ErrorCode
    {
        /// a key set contains the same key twice, or two ring members have the same key set
        DUPLICATE_KEY,
        /// a key set's layer count differs from the ring's (or exceeds the layer limit)
        MISMATCHED_KEY_LENGTH,
        /// a second signer was added to a ring
        MULTIPLE_SIGNERS,
        /// signing was requested on a ring without a signer
        NO_SIGNER,
        /// signing was requested on a ring with no members
        EMPTY_RING,
        /// a key set has no keys
        EMPTY_KEY_SET,
        /// vector lengths are inconsistent (or the ring is too large)
        LENGTH_MISMATCH,
        /// a point or scalar has a non-canonical or disallowed encoding
        INVALID_ENCODING,
        /// the challenge chain of a signature does not close
        CHALLENGE_MISMATCH,
        /// the curve/hash backend failed
        CRYPTO_BACKEND_ERROR
    };

    /// error code
    ErrorCode error_code;

    /// optional error message (e.g. for exceptions)
    std::string error_message;
};

/// readable name of an error code
const char* error_code_to_string(const ClsagError::ErrorCode error_code);

////
// ClsagException
// - thrown by key set construction, ring assembly, and signing
///
class ClsagException final : public std::runtime_error
{
public:
    explicit ClsagException(ClsagError error);

    const ClsagError& error() const noexcept { return m_error; }
    ClsagError::ErrorCode code() const noexcept { return m_error.error_code; }

private:
    ClsagError m_error;
};

/// log and throw a ClsagException
[[noreturn]] void throw_clsag_error(const ClsagError::ErrorCode error_code, std::string error_message);

/// outcome of verifying a signature (verification never throws on bad input)
enum class ClsagVerifyStatus
{
    VALID,
    LENGTH_MISMATCH,
    INVALID_ENCODING,
    CHALLENGE_MISMATCH
};

/// readable name of a verification status
const char* verify_status_to_string(const ClsagVerifyStatus status);

} //namespace clsag

/// throw a ClsagException with 'error_code' if 'expr' is false
#define CLSAG_CHECK_AND_THROW(expr, error_code, message)                                \
    do {                                                                                \
        if (!(expr))                                                                    \
            ::clsag::throw_clsag_error(::clsag::ClsagError::ErrorCode::error_code, message); \
    } while (0)
