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
#include "clsag_errors.h"

//local headers
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <string>
#include <utility>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
//-------------------------------------------------------------------------------------------------------------------
const char* error_code_to_string(const ClsagError::ErrorCode error_code)
{
    switch (error_code)
    {
        case ClsagError::ErrorCode::DUPLICATE_KEY:         return "duplicate key";
        case ClsagError::ErrorCode::MISMATCHED_KEY_LENGTH: return "mismatched key length";
        case ClsagError::ErrorCode::MULTIPLE_SIGNERS:      return "multiple signers";
        case ClsagError::ErrorCode::NO_SIGNER:             return "no signer";
        case ClsagError::ErrorCode::EMPTY_RING:            return "empty ring";
        case ClsagError::ErrorCode::EMPTY_KEY_SET:         return "empty key set";
        case ClsagError::ErrorCode::LENGTH_MISMATCH:       return "length mismatch";
        case ClsagError::ErrorCode::INVALID_ENCODING:      return "invalid encoding";
        case ClsagError::ErrorCode::CHALLENGE_MISMATCH:    return "challenge mismatch";
        case ClsagError::ErrorCode::CRYPTO_BACKEND_ERROR:  return "crypto backend error";
        default:                                           return "unknown error";
    }
}
//-------------------------------------------------------------------------------------------------------------------
ClsagException::ClsagException(ClsagError error) :
    std::runtime_error{std::string{error_code_to_string(error.error_code)} + ": " + error.error_message},
    m_error{std::move(error)}
{}
//-------------------------------------------------------------------------------------------------------------------
void throw_clsag_error(const ClsagError::ErrorCode error_code, std::string error_message)
{
    if (error_code == ClsagError::ErrorCode::CRYPTO_BACKEND_ERROR)
        MERROR("clsag " << error_code_to_string(error_code) << ": " << error_message);
    else
        MDEBUG("clsag " << error_code_to_string(error_code) << ": " << error_message);

    throw ClsagException{ClsagError{error_code, std::move(error_message)}};
}
//-------------------------------------------------------------------------------------------------------------------
const char* verify_status_to_string(const ClsagVerifyStatus status)
{
    switch (status)
    {
        case ClsagVerifyStatus::VALID:              return "valid";
        case ClsagVerifyStatus::LENGTH_MISMATCH:    return "length mismatch";
        case ClsagVerifyStatus::INVALID_ENCODING:   return "invalid encoding";
        case ClsagVerifyStatus::CHALLENGE_MISMATCH: return "challenge mismatch";
        default:                                    return "unknown status";
    }
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace clsag
