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

// Transcript classes for assembling data that needs to be hashed.

#pragma once

//local headers
#include "crypto_types.h"
#include "wipeable_string.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

//forward declarations


namespace clsag
{
namespace crypto
{

////
// TranscriptBuilder
// - build a transcript
// - data types: objects are prefixed with a label
//     - unsigned int: uint_flag || varint(uint_variable)
//     - byte buffer (assumed little-endian): buffer_flag || buffer_length || buffer
//       - all labels are treated as byte buffers
//     - named container: container_flag || container_name || data_member1 || ... || container_terminator_flag
//     - list-type container (same-type elements only): list_flag || list_length || element1 || element2 || ...
///
class TranscriptBuilder final
{
//member types
    /// flags for separating items added to the transcript
    enum TranscriptBuilderFlag : unsigned char
    {
        UNSIGNED_INTEGER = 1,
        BYTE_BUFFER = 3,
        NAMED_CONTAINER = 4,
        NAMED_CONTAINER_TERMINATOR = 5,
        LIST_TYPE_CONTAINER = 6
    };

//core member functions
    void append_uint(std::uint64_t unsigned_integer)
    {
        // LEB128 varint: 7 bits per byte, high bit set on all but the last byte
        char v_variable[(sizeof(std::uint64_t) * 8 + 6) / 7];
        std::size_t v_length{0};

        while (unsigned_integer >= 0x80)
        {
            v_variable[v_length++] = static_cast<char>((unsigned_integer & 0x7f) | 0x80);
            unsigned_integer >>= 7;
        }
        v_variable[v_length++] = static_cast<char>(unsigned_integer);

        m_transcript.append(v_variable, v_length);
    }
    void append_flag(const TranscriptBuilderFlag flag)
    {
        append_uint(static_cast<std::uint64_t>(flag));
    }
    void append_length(const std::size_t length)
    {
        static_assert(sizeof(std::size_t) <= sizeof(std::uint64_t), "TranscriptBuilder: size_t greater than uint64_t.");
        append_uint(static_cast<std::uint64_t>(length));
    }
    void append_buffer(const void *data, const std::size_t length)
    {
        append_flag(TranscriptBuilderFlag::BYTE_BUFFER);
        append_length(length);
        m_transcript.append(reinterpret_cast<const char*>(data), length);
    }
    void append_label(const boost::string_ref label)
    {
        append_buffer(label.data(), label.size());
    }
    void begin_named_container(const boost::string_ref container_name)
    {
        append_flag(TranscriptBuilderFlag::NAMED_CONTAINER);
        append_label(container_name);
    }
    void end_named_container()
    {
        append_flag(TranscriptBuilderFlag::NAMED_CONTAINER_TERMINATOR);
    }
    void begin_list_type_container(const std::size_t list_length)
    {
        append_flag(TranscriptBuilderFlag::LIST_TYPE_CONTAINER);
        append_length(list_length);
    }

public:
//constructors
    /// normal constructor: start building a transcript
    explicit TranscriptBuilder(const std::size_t estimated_data_size)
    {
        m_transcript.reserve(2 * estimated_data_size + 20);
    }

//overloaded operators
    /// disable copy/move (this is a scoped manager [of the 'transcript' concept])
    TranscriptBuilder& operator=(TranscriptBuilder&&) = delete;

//member functions
    /// transcript builders
    void append(const boost::string_ref label, const key &key_buffer)
    {
        append_label(label);
        append_buffer(key_buffer.bytes, sizeof(key_buffer));
    }
    void append(const boost::string_ref label, const std::string &string_buffer)
    {
        append_label(label);
        append_buffer(string_buffer.data(), string_buffer.size());
    }
    void append(const boost::string_ref label, const boost::string_ref string_buffer)
    {
        append_label(label);
        append_buffer(string_buffer.data(), string_buffer.size());
    }
    template<std::size_t Sz>
    void append(const boost::string_ref label, const char(&char_buffer)[Sz])
    {
        append_label(label);
        append_buffer(char_buffer, Sz);
    }
    template<typename T,
        std::enable_if_t<std::is_unsigned<T>::value, bool> = true>
    void append(const boost::string_ref label, const T unsigned_integer)
    {
        static_assert(sizeof(T) <= sizeof(std::uint64_t), "TranscriptBuilder: unsupported unsigned integer type.");
        append_label(label);
        append_flag(TranscriptBuilderFlag::UNSIGNED_INTEGER);
        append_uint(unsigned_integer);
    }
    template<typename T,
        std::enable_if_t<!std::is_integral<T>::value, bool> = true>
    void append(const boost::string_ref label, const T &named_container)
    {
        // named containers must satisfy two concepts:
        //   const boost::string_ref container_name(const T &container);
        //   void append_to_transcript(const T &container, TranscriptBuilder &transcript_inout);
        append_label(label);
        begin_named_container(container_name(named_container));
        append_to_transcript(named_container, *this);
        end_named_container();
    }
    template<typename T>
    void append(const boost::string_ref label, const std::vector<T> &list_container)
    {
        append_label(label);
        begin_list_type_container(list_container.size());
        for (const T &element : list_container)
            append("", element);
    }

    /// access the transcript data
    const void* data() const { return m_transcript.data(); }
    std::size_t size() const { return m_transcript.size(); }

//member variables
private:
    /// the transcript itself (wipeable in case it contains sensitive data)
    epee::wipeable_string m_transcript;
};

////
// FSTranscript
// - build a Fiat-Shamir transcript
// - main format: transcript_prefix || domain_separator || object1_label || object1 || object2_label || object2 || ...
///
class FSTranscript final
{
public:
//constructors
    /// normal constructor: start building a transcript with the domain separator
    FSTranscript(const boost::string_ref domain_separator, const std::size_t estimated_data_size);

//overloaded operators
    /// disable copy/move (this is a scoped manager [of the 'transcript' concept])
    FSTranscript& operator=(FSTranscript&&) = delete;

//member functions
    /// transcript builders
    template<typename T>
    void append(const boost::string_ref label, const T &value)
    {
        m_transcript_builder.append(label, value);
    }

    /// access the transcript data
    const void* data() const { return m_transcript_builder.data(); }
    std::size_t size() const { return m_transcript_builder.size(); }

//member variables
private:
    /// underlying transcript builder
    TranscriptBuilder m_transcript_builder;
};

} //namespace crypto
} //namespace clsag
