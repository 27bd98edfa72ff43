//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "debug_log.hpp"
#include "nativetds/buffer.hpp"

using namespace nativetds;

// --- byte_slice ---
byte_slice::byte_slice(detail::buffer_block* block, std::size_t offset, std::size_t size) noexcept
    : block_(block), offset_(offset), size_(size)
{
    BOOST_ASSERT(block_ != nullptr);
    BOOST_ASSERT(offset_ + size_ <= block_->storage.size());
    ++block_->refcount;
}

byte_slice::byte_slice(byte_slice&& rhs) noexcept
    : block_(std::exchange(rhs.block_, nullptr)),
      offset_(std::exchange(rhs.offset_, 0u)),
      size_(std::exchange(rhs.size_, 0u))
{
}

byte_slice& byte_slice::operator=(byte_slice&& rhs) noexcept
{
    if (this != &rhs)
    {
        release();
        block_ = std::exchange(rhs.block_, nullptr);
        offset_ = std::exchange(rhs.offset_, 0u);
        size_ = std::exchange(rhs.size_, 0u);
    }
    return *this;
}

std::span<const unsigned char> byte_slice::data() const noexcept
{
    if (!block_)
        return {};
    return {block_->storage.data() + offset_, size_};
}

std::span<unsigned char> byte_slice::mutable_data() noexcept
{
    if (!block_)
        return {};
    return {block_->storage.data() + offset_, size_};
}

std::size_t byte_slice::use_count() const noexcept { return block_ ? block_->refcount : 0u; }

byte_slice byte_slice::retained_slice(std::size_t offset, std::size_t size) const
{
    BOOST_ASSERT(block_ != nullptr);
    BOOST_ASSERT(offset + size <= size_);
    return byte_slice(block_, offset_ + offset, size);
}

void byte_slice::release() noexcept
{
    if (!block_)
        return;
    auto* block = std::exchange(block_, nullptr);
    offset_ = 0u;
    size_ = 0u;
    BOOST_ASSERT(block->refcount > 0u);
    if (--block->refcount == 0u)
        block->pool->recycle(block);
}

// --- composite_slice ---
composite_slice::composite_slice(composite_slice&& rhs) noexcept
    : components_(std::move(rhs.components_)), first_(std::exchange(rhs.first_, 0u))
{
    rhs.components_.clear();
}

composite_slice& composite_slice::operator=(composite_slice&& rhs) noexcept
{
    if (this != &rhs)
    {
        release();
        components_ = std::move(rhs.components_);
        first_ = std::exchange(rhs.first_, 0u);
        rhs.components_.clear();
    }
    return *this;
}

void composite_slice::add_component(byte_slice s)
{
    BOOST_ASSERT(s.owns());
    components_.push_back(std::move(s));
}

std::size_t composite_slice::size() const noexcept
{
    std::size_t res = 0u;
    for (std::size_t i = first_; i < components_.size(); ++i)
        res += components_[i].size();
    return res;
}

std::vector<unsigned char> composite_slice::to_vector() const
{
    std::vector<unsigned char> res;
    res.reserve(size());
    for (std::size_t i = first_; i < components_.size(); ++i)
    {
        auto bytes = components_[i].data();
        res.insert(res.end(), bytes.begin(), bytes.end());
    }
    return res;
}

void composite_slice::release_front() noexcept
{
    if (first_ < components_.size())
        components_[first_++].release();
}

void composite_slice::release() noexcept
{
    for (std::size_t i = first_; i < components_.size(); ++i)
        components_[i].release();
    components_.clear();
    first_ = 0u;
}

// --- buffer_pool ---
// recycle() is noexcept, so the free list never grows past its initial capacity
buffer_pool::buffer_pool(buffer_pool_config cfg) : cfg_(cfg) { free_.reserve(cfg_.max_pooled_blocks); }

buffer_pool::~buffer_pool()
{
    // Blocks still referenced here would leave dangling slices behind
    BOOST_ASSERT(outstanding() == 0u);
}

byte_slice buffer_pool::allocate(std::size_t size)
{
    // Reuse the first free block that is big enough
    auto it = std::find_if(free_.begin(), free_.end(), [size](const detail::buffer_block* b) {
        return b->storage.size() >= size;
    });
    if (it != free_.end())
    {
        auto* block = *it;
        free_.erase(it);
        return byte_slice(block, 0u, block->storage.size());
    }

    auto block = std::make_unique<detail::buffer_block>();
    block->pool = this;
    block->storage.resize((std::max)(size, cfg_.block_size));
    auto* raw = block.get();
    blocks_.push_back(std::move(block));
    NATIVETDS_LOG(2, "buffer_pool: allocated block of %zu bytes (%zu blocks in total)", raw->storage.size(),
                  blocks_.size());
    return byte_slice(raw, 0u, raw->storage.size());
}

byte_slice buffer_pool::copy_of(std::span<const unsigned char> bytes)
{
    auto whole = allocate(bytes.size());
    if (!bytes.empty())
        std::memcpy(whole.mutable_data().data(), bytes.data(), bytes.size());
    auto res = whole.retained_slice(0u, bytes.size());
    whole.release();
    return res;
}

void buffer_pool::recycle(detail::buffer_block* block) noexcept
{
    BOOST_ASSERT(block->refcount == 0u);
    if (free_.size() < cfg_.max_pooled_blocks)
    {
        free_.push_back(block);
        return;
    }

    // The pool is full. Give the memory back
    auto it = std::find_if(blocks_.begin(), blocks_.end(), [block](const auto& b) { return b.get() == block; });
    BOOST_ASSERT(it != blocks_.end());
    blocks_.erase(it);
}
