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

// Linkability: detect key images that were already used by an earlier signature.
// WARNING: CLSAG verification does NOT check key image uniqueness; callers must do it with a context like this.

#pragma once

//local headers
#include "clsag_types.h"
#include "crypto/crypto_types.h"

//third party headers
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <cstddef>
#include <unordered_set>

//forward declarations


namespace clsag
{

class KeyImageLinkabilityContext
{
public:
//destructor
    virtual ~KeyImageLinkabilityContext() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    KeyImageLinkabilityContext& operator=(KeyImageLinkabilityContext&&) = delete;

//member functions
    /**
    * brief: key_image_exists - checks if a key image exists in the linkability context
    * param: key_image -
    * return: true/false on check result
    */
    virtual bool key_image_exists(const crypto::key &key_image) const = 0;
};

////
// KeyImageStoreSimple
// - in-memory key image set
// - thread-safe; try_add_key_images() checks and records in one step
///
class KeyImageStoreSimple final : public KeyImageLinkabilityContext
{
public:
    bool key_image_exists(const crypto::key &key_image) const override;
    /**
    * brief: try_add_key_images - record a signature's key images if none of them are known yet
    * param: signature -
    * return: false if any key image already exists (nothing is recorded in that case)
    */
    bool try_add_key_images(const ClsagSignature &signature);
    std::size_t num_key_images() const;

private:
    bool key_image_exists_impl(const crypto::key &key_image) const;

//member variables
    mutable boost::shared_mutex m_context_mutex;
    std::unordered_set<crypto::key> m_key_images;
};

/**
* brief: signature_is_linked - check if any of a signature's key images exist in a linkability context
* param: signature -
* param: linkability_context -
* return: true if the signer already used at least one of these private keys
*/
bool signature_is_linked(const ClsagSignature &signature, const KeyImageLinkabilityContext &linkability_context);

} //namespace clsag
