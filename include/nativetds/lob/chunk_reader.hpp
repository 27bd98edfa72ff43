//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_LOB_CHUNK_READER_HPP
#define NATIVETDS_LOB_CHUNK_READER_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <vector>

#include "nativetds/buffer.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/protocol/type_info.hpp"

namespace nativetds {
namespace lob {
namespace detail {

// Walks the wire bytes of one column value, returning the payload of every chunk in order.
// PLP values yield each chunk. Scalar values yield their payload as a single chunk.
// Owns the column data, and releases each part of it once it has been read past.
// When the value is exhausted, or is found to be malformed, everything is released.
class chunk_reader
{
public:
    enum class result_type
    {
        chunk,  // payload() is valid until the next call to next(), release_consumed() or release()
        end,    // the terminator was found (or the value is NULL). Nothing is owned anymore
        error,  // the value is malformed. Nothing is owned anymore
    };

private:
    enum class state_t
    {
        header,
        chunks,
        scalar_done,
        finished,
    };

    composite_slice data_;
    protocol::type_info type_;
    state_t state_{state_t::header};
    std::size_t offset_{};  // into the first owned component
    std::vector<unsigned char> scratch_;
    std::span<const unsigned char> payload_;
    boost::system::error_code ec_;

    std::size_t available() const noexcept { return data_.size() - offset_; }
    std::span<const unsigned char> read(std::size_t n);
    bool peek(std::size_t skip, std::span<unsigned char> to) const noexcept;
    bool chunk_at(std::size_t skip) const noexcept;
    result_type finish(boost::system::error_code ec);
    result_type read_header();
    result_type read_chunk();

public:
    chunk_reader(protocol::column_data data, const protocol::type_info& type);

    result_type next();

    // Would next() return a chunk with a non-empty payload? Reads nothing.
    // False when the value is NULL, exhausted or malformed
    bool chunk_ahead() const noexcept;

    std::span<const unsigned char> payload() const noexcept { return payload_; }
    boost::system::error_code error() const noexcept { return ec_; }
    bool owns() const noexcept { return data_.owns(); }

    // Releases the parts of the value that have been read entirely. Invalidates payload()
    void release_consumed() noexcept;

    // Releases everything that hasn't been read. No more chunks are returned
    void release() noexcept;
};

}  // namespace detail
}  // namespace lob
}  // namespace nativetds

#endif
