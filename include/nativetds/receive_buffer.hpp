//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_RECEIVE_BUFFER_HPP
#define NATIVETDS_RECEIVE_BUFFER_HPP

#include <boost/assert.hpp>
#include <boost/endian/detail/endian_load.hpp>

#include <cstddef>
#include <span>

#include "nativetds/buffer.hpp"

namespace nativetds {

// The connection-level buffer where received bytes accumulate.
//
// Layout of the current block:
//   [0, reader_index): already read. Discarded by discard_read_bytes()
//   [reader_index, writer_index): readable
//   [writer_index, capacity): writable. Obtained with prepare(), published with commit()
//
// Reads never copy: read_retained_slice() returns an owned slice into the current block,
// which keeps the block alive after the buffer has moved on to a new one.
class receive_buffer
{
    buffer_pool& pool_;
    byte_slice block_;
    std::size_t reader_index_{};
    std::size_t writer_index_{};

    // Makes sure that at least n bytes can be written. May move the readable bytes
    void ensure_writable(std::size_t n);

public:
    explicit receive_buffer(buffer_pool& pool) noexcept : pool_(pool) {}
    receive_buffer(const receive_buffer&) = delete;
    receive_buffer& operator=(const receive_buffer&) = delete;

    buffer_pool& pool() noexcept { return pool_; }

    // --- Writing ---
    // Returns a region of at least n writable bytes
    std::span<unsigned char> prepare(std::size_t n);

    // Marks n bytes of the region returned by prepare() as readable
    void commit(std::size_t n);

    // prepare + copy + commit
    void append(std::span<const unsigned char> bytes);

    // --- Reading ---
    std::size_t readable_bytes() const noexcept { return writer_index_ - reader_index_; }
    std::span<const unsigned char> readable() const noexcept
    {
        return block_.data().subspan(reader_index_, readable_bytes());
    }

    // The read cursor. Saving and restoring it is how non-destructive probes are written
    std::size_t reader_index() const noexcept { return reader_index_; }
    void reset_reader_index(std::size_t index) noexcept
    {
        BOOST_ASSERT(index <= writer_index_);
        reader_index_ = index;
    }

    // Advances the cursor. The caller must have checked readable_bytes()
    void skip(std::size_t n) noexcept
    {
        BOOST_ASSERT(n <= readable_bytes());
        reader_index_ += n;
    }

    // Reads a little-endian integer. The caller must have checked readable_bytes()
    template <class IntType>
    IntType read_integral() noexcept
    {
        BOOST_ASSERT(sizeof(IntType) <= readable_bytes());
        auto res = boost::endian::endian_load<IntType, sizeof(IntType), boost::endian::order::little>(
            block_.data().data() + reader_index_
        );
        reader_index_ += sizeof(IntType);
        return res;
    }

    // Returns an owned slice over the next n bytes and advances the cursor past them.
    // The caller must have checked readable_bytes()
    byte_slice read_retained_slice(std::size_t n);

    // Drops the bytes before the cursor, so their space can be reused
    void discard_read_bytes();

    // Gives the current block back to the pool. Readable bytes are lost
    void release() noexcept;
};

}  // namespace nativetds

#endif
