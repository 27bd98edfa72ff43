//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_LOB_LOB_CODEC_HPP
#define NATIVETDS_LOB_LOB_CODEC_HPP

#include <boost/throw_exception.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>

#include "nativetds/config.hpp"
#include "nativetds/lob/chunked_object_stream.hpp"
#include "nativetds/lob/segment_decoder.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/protocol/type_info.hpp"

namespace nativetds {
namespace lob {

// A large object value, owning its column data until it's streamed or discarded.
// The contents can be streamed only once.
template <class Decoder>
class basic_lob
{
    std::optional<protocol::column_data> data_;
    protocol::type_info type_;
    stream_config cfg_;

public:
    using stream_type = basic_chunked_object_stream<Decoder>;

    basic_lob(protocol::column_data data, const protocol::type_info& type, const stream_config& cfg = {})
        : data_(std::move(data)), type_(type), cfg_(cfg)
    {
    }

    const protocol::type_info& type() const noexcept { return type_; }

    // Whether stream() may still be called
    bool owns() const noexcept { return data_.has_value(); }

    // Transfers the column data to a new stream. Calling it twice, or after discard(), is an error
    stream_type stream()
    {
        if (!data_)
            BOOST_THROW_EXCEPTION(std::logic_error("basic_lob::stream: the value was already consumed"));
        stream_type res(std::move(*data_), type_, cfg_);
        data_.reset();
        return res;
    }

    // Releases the column data without reading it
    void discard() noexcept { data_.reset(); }
};

using clob = basic_lob<text_decoder>;
using blob = basic_lob<binary_decoder>;

// Character large objects: char, varchar, nchar, nvarchar (MAX or not), text, ntext and xml
struct clob_codec
{
    static bool can_decode(const protocol::type_info& type) noexcept;

    // Takes ownership of a non-NULL value. type must satisfy can_decode
    static clob decode(protocol::column_data data, const protocol::type_info& type, const stream_config& cfg = {});

    // Transfers column index out of the row. Returns an empty optional if the column is NULL
    static std::optional<clob> decode(
        protocol::row_token& row,
        std::size_t index,
        const protocol::type_info& type,
        const stream_config& cfg = {}
    );
};

// Binary large objects: binary, varbinary (MAX or not) and image
struct blob_codec
{
    static bool can_decode(const protocol::type_info& type) noexcept;
    static blob decode(protocol::column_data data, const protocol::type_info& type, const stream_config& cfg = {});
    static std::optional<blob> decode(
        protocol::row_token& row,
        std::size_t index,
        const protocol::type_info& type,
        const stream_config& cfg = {}
    );
};

}  // namespace lob
}  // namespace nativetds

#endif
