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
#include "clsag_linkability.h"

//local headers
#include "clsag_types.h"
#include "crypto/crypto_types.h"
#include "misc_log_ex.h"

//third party headers
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <unordered_set>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "clsag"

namespace clsag
{
//-------------------------------------------------------------------------------------------------------------------
bool KeyImageStoreSimple::key_image_exists(const crypto::key &key_image) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return key_image_exists_impl(key_image);
}
//-------------------------------------------------------------------------------------------------------------------
bool KeyImageStoreSimple::try_add_key_images(const ClsagSignature &signature)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    // 1. reject if any key image is known (or repeated within the signature)
    std::unordered_set<crypto::key> new_key_images;
    for (const crypto::key &key_image : signature.key_images)
    {
        if (key_image_exists_impl(key_image) ||
            !new_key_images.insert(key_image).second)
        {
            MDEBUG("Key image store: signature reuses a known key image.");
            return false;
        }
    }

    // 2. record
    m_key_images.insert(new_key_images.begin(), new_key_images.end());

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t KeyImageStoreSimple::num_key_images() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return m_key_images.size();
}
//-------------------------------------------------------------------------------------------------------------------
bool KeyImageStoreSimple::key_image_exists_impl(const crypto::key &key_image) const
{
    return m_key_images.find(key_image) != m_key_images.end();
}
//-------------------------------------------------------------------------------------------------------------------
bool signature_is_linked(const ClsagSignature &signature, const KeyImageLinkabilityContext &linkability_context)
{
    for (const crypto::key &key_image : signature.key_images)
    {
        if (linkability_context.key_image_exists(key_image))
            return true;
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace clsag
