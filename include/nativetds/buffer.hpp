//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_BUFFER_HPP
#define NATIVETDS_BUFFER_HPP

// Reference-counted, pooled network buffers.
//
// A buffer_pool owns blocks of memory. Every block carries a reference count.
// Code never manipulates counts directly: it holds byte_slice objects, which own
// exactly one reference each. Slices are move-only. Releasing a slice (explicitly
// or by destroying it) gives its reference back, and a block that reaches zero
// references returns to the pool. A second reference to the same bytes must
// be created explicitly, with retained_slice() or retained_duplicate().
//
// Pools and the slices they hand out are not thread-safe. They may be moved
// between threads, as long as a single thread uses them at a time.

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include "nativetds/config.hpp"

namespace nativetds {

class buffer_pool;

namespace detail {

struct buffer_block
{
    buffer_pool* pool;
    std::vector<unsigned char> storage;
    std::size_t refcount{};
};

}  // namespace detail

// An owned view over a range of bytes in a pooled block
class byte_slice
{
    detail::buffer_block* block_{};
    std::size_t offset_{};
    std::size_t size_{};

    byte_slice(detail::buffer_block* block, std::size_t offset, std::size_t size) noexcept;

    friend class buffer_pool;

public:
    // An empty slice that doesn't own anything
    byte_slice() noexcept = default;

    byte_slice(const byte_slice&) = delete;
    byte_slice& operator=(const byte_slice&) = delete;
    byte_slice(byte_slice&& rhs) noexcept;
    byte_slice& operator=(byte_slice&& rhs) noexcept;
    ~byte_slice() { release(); }

    // Does this slice hold a reference?
    bool owns() const noexcept { return block_ != nullptr; }
    explicit operator bool() const noexcept { return owns(); }

    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0u; }

    std::span<const unsigned char> data() const noexcept;
    std::span<unsigned char> mutable_data() noexcept;

    // The reference count of the underlying block. 0 if this slice doesn't own anything
    std::size_t use_count() const noexcept;

    // New owned handles over the same block. The original keeps its own reference
    byte_slice retained_slice(std::size_t offset, std::size_t size) const;
    byte_slice retained_duplicate() const { return retained_slice(0, size_); }

    // Gives the reference back. Calling it on an empty slice is a no-op,
    // so a slice is released exactly once whatever the path.
    void release() noexcept;
};

// An ordered sequence of owned slices, read as a single byte range
class composite_slice
{
    std::vector<byte_slice> components_;
    std::size_t first_{};  // components before this one have been released

public:
    composite_slice() = default;
    composite_slice(const composite_slice&) = delete;
    composite_slice& operator=(const composite_slice&) = delete;
    composite_slice(composite_slice&& rhs) noexcept;
    composite_slice& operator=(composite_slice&& rhs) noexcept;
    ~composite_slice() = default;

    // Takes ownership of the given slice
    void add_component(byte_slice s);

    bool owns() const noexcept { return first_ < components_.size(); }

    // Components still owned. component(0) is the first one that hasn't been released
    std::size_t num_components() const noexcept { return components_.size() - first_; }
    const byte_slice& component(std::size_t i) const { return components_.at(first_ + i); }

    // Total bytes across the components still owned
    std::size_t size() const noexcept;

    // Copies all owned bytes, in order
    std::vector<unsigned char> to_vector() const;

    // Releases the first component
    void release_front() noexcept;

    // Releases every component still owned
    void release() noexcept;
};

class buffer_pool
{
    buffer_pool_config cfg_;
    std::vector<std::unique_ptr<detail::buffer_block>> blocks_;
    std::vector<detail::buffer_block*> free_;

    friend class byte_slice;
    void recycle(detail::buffer_block* block) noexcept;

public:
    explicit buffer_pool(buffer_pool_config cfg = {});
    buffer_pool(const buffer_pool&) = delete;
    buffer_pool& operator=(const buffer_pool&) = delete;

    // All slices must have been released by the time the pool is destroyed
    ~buffer_pool();

    const buffer_pool_config& config() const noexcept { return cfg_; }

    // Returns a slice spanning a whole block of at least size bytes, with a reference count of 1
    byte_slice allocate(std::size_t size);

    // Copies the given bytes into a newly allocated block
    byte_slice copy_of(std::span<const unsigned char> bytes);

    // Number of blocks with a non-zero reference count
    std::size_t outstanding() const noexcept { return blocks_.size() - free_.size(); }

    // Number of blocks waiting to be reused
    std::size_t pooled() const noexcept { return free_.size(); }
};

}  // namespace nativetds

#endif
