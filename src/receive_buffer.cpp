//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>

#include <cstddef>
#include <cstring>
#include <span>
#include <utility>

#include "debug_log.hpp"
#include "nativetds/buffer.hpp"
#include "nativetds/receive_buffer.hpp"

using namespace nativetds;

void receive_buffer::ensure_writable(std::size_t n)
{
    const std::size_t capacity = block_.size();
    if (block_.owns() && capacity - writer_index_ >= n)
        return;

    const std::size_t readable = readable_bytes();

    // If nobody else references the block and compacting makes enough room, do it in place
    if (block_.owns() && block_.use_count() == 1u && capacity - readable >= n)
    {
        auto data = block_.mutable_data();
        std::memmove(data.data(), data.data() + reader_index_, readable);
        reader_index_ = 0u;
        writer_index_ = readable;
        return;
    }

    // Move the readable bytes to a new block. Slices into the old one keep it alive
    auto new_block = pool_.allocate(readable + n);
    if (readable)
        std::memcpy(new_block.mutable_data().data(), block_.data().data() + reader_index_, readable);
    NATIVETDS_LOG(2, "receive_buffer: moved %zu readable bytes to a block of %zu bytes", readable,
                  new_block.size());
    block_ = std::move(new_block);
    reader_index_ = 0u;
    writer_index_ = readable;
}

std::span<unsigned char> receive_buffer::prepare(std::size_t n)
{
    ensure_writable(n);
    return block_.mutable_data().subspan(writer_index_);
}

void receive_buffer::commit(std::size_t n)
{
    BOOST_ASSERT(writer_index_ + n <= block_.size());
    writer_index_ += n;
}

void receive_buffer::append(std::span<const unsigned char> bytes)
{
    if (bytes.empty())
        return;
    auto to = prepare(bytes.size());
    std::memcpy(to.data(), bytes.data(), bytes.size());
    commit(bytes.size());
}

byte_slice receive_buffer::read_retained_slice(std::size_t n)
{
    BOOST_ASSERT(n <= readable_bytes());
    auto res = block_.retained_slice(reader_index_, n);
    reader_index_ += n;
    return res;
}

void receive_buffer::discard_read_bytes()
{
    if (!block_.owns())
        return;

    if (reader_index_ == writer_index_)
    {
        // Nothing left to read. If we're the only owner, just rewind
        if (block_.use_count() == 1u)
        {
            reader_index_ = writer_index_ = 0u;
        }
        else
        {
            // Someone still references this block. Let them have it
            block_.release();
            reader_index_ = writer_index_ = 0u;
        }
        return;
    }

    // Compacting in place is only safe if no slice points into the block
    if (reader_index_ > 0u && block_.use_count() == 1u)
    {
        auto data = block_.mutable_data();
        std::memmove(data.data(), data.data() + reader_index_, readable_bytes());
        writer_index_ -= reader_index_;
        reader_index_ = 0u;
    }
}

void receive_buffer::release() noexcept
{
    block_.release();
    reader_index_ = writer_index_ = 0u;
}
