//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <span>
#include <utility>

#include "debug_log.hpp"
#include "nativetds/buffer.hpp"
#include "nativetds/client_errc.hpp"
#include "nativetds/lob/chunk_reader.hpp"
#include "nativetds/protocol/length.hpp"
#include "nativetds/protocol/row_token.hpp"

using namespace nativetds;
using lob::detail::chunk_reader;
using boost::system::error_code;

namespace {

composite_slice to_composite(protocol::column_data data)
{
    if (auto* s = boost::variant2::get_if<byte_slice>(&data))
    {
        composite_slice res;
        if (s->owns())
            res.add_component(std::move(*s));
        return res;
    }
    return std::move(boost::variant2::get<composite_slice>(data));
}

}  // namespace

chunk_reader::chunk_reader(protocol::column_data data, const protocol::type_info& type)
    : data_(to_composite(std::move(data))), type_(type)
{
}

void chunk_reader::release_consumed() noexcept
{
    payload_ = {};
    while (data_.num_components() > 0u && offset_ >= data_.component(0).size())
    {
        offset_ -= data_.component(0).size();
        data_.release_front();
    }
}

// Returns the next n bytes, advancing past them. available() >= n is required.
// The bytes are referenced in place when they're contiguous, and gathered into scratch_ otherwise
std::span<const unsigned char> chunk_reader::read(std::size_t n)
{
    BOOST_ASSERT(available() >= n);

    // Skip components we've fully read, without releasing them: a previous span may point there
    std::size_t comp = 0u;
    std::size_t off = offset_;
    while (comp < data_.num_components() && off >= data_.component(comp).size())
    {
        off -= data_.component(comp).size();
        ++comp;
    }
    if (n == 0u)
        return {};

    auto first = data_.component(comp).data().subspan(off);
    if (first.size() >= n)
    {
        offset_ += n;
        return first.first(n);
    }

    scratch_.resize(n);
    std::size_t copied = 0u;
    while (copied < n)
    {
        auto bytes = data_.component(comp).data().subspan(off);
        auto to_copy = (std::min)(bytes.size(), n - copied);
        std::memcpy(scratch_.data() + copied, bytes.data(), to_copy);
        copied += to_copy;
        off = 0u;
        ++comp;
    }
    offset_ += n;
    return scratch_;
}

// Copies the to.size() bytes that start skip bytes past the read position, without advancing
bool chunk_reader::peek(std::size_t skip, std::span<unsigned char> to) const noexcept
{
    if (available() < skip + to.size())
        return false;
    std::size_t comp = 0u;
    std::size_t off = offset_ + skip;
    std::size_t copied = 0u;
    while (copied < to.size())
    {
        const auto comp_size = data_.component(comp).size();
        if (off >= comp_size)
        {
            off -= comp_size;
            ++comp;
            continue;
        }
        auto bytes = data_.component(comp).data().subspan(off);
        auto to_copy = (std::min)(bytes.size(), to.size() - copied);
        std::memcpy(to.data() + copied, bytes.data(), to_copy);
        copied += to_copy;
        off = 0u;
        ++comp;
    }
    return true;
}

// Is there a complete, non-terminator chunk skip bytes past the read position?
bool chunk_reader::chunk_at(std::size_t skip) const noexcept
{
    std::array<unsigned char, protocol::plp_chunk_header_size> header{};
    if (!peek(skip, header))
        return false;
    auto chunk_length = protocol::parse_chunk_length(header);
    return chunk_length != 0u && available() - skip - header.size() >= chunk_length;
}

bool chunk_reader::chunk_ahead() const noexcept
{
    switch (state_)
    {
        case state_t::header:
        {
            if (type_.is_plp())
            {
                std::array<unsigned char, protocol::plp_length_size> total{};
                if (!peek(0u, total) || protocol::parse_plp_length(total).is_null())
                    return false;
                return chunk_at(total.size());
            }
            std::array<unsigned char, 8> descriptor{};
            const auto desc_size = protocol::descriptor_size(type_);
            BOOST_ASSERT(desc_size <= descriptor.size());
            auto desc = std::span<unsigned char>(descriptor).first(desc_size);
            if (!peek(0u, desc))
                return false;
            auto len = protocol::parse_scalar_length(desc, type_);
            return !len.is_null && len.size != 0u && available() - desc_size == len.size;
        }
        case state_t::chunks: return chunk_at(0u);
        case state_t::scalar_done:
        case state_t::finished:
        default: return false;
    }
}

chunk_reader::result_type chunk_reader::finish(error_code ec)
{
    release();
    ec_ = ec;
    if (ec)
    {
        NATIVETDS_LOG(1, "chunk_reader: %s", ec.message().c_str());
        return result_type::error;
    }
    return result_type::end;
}

chunk_reader::result_type chunk_reader::read_header()
{
    if (!type_.is_plp())
    {
        const auto descriptor = protocol::descriptor_size(type_);
        if (available() < descriptor)
            return finish(client_errc::incomplete_message);
        auto len = protocol::parse_scalar_length(read(descriptor), type_);
        if (len.is_null)
            return finish({});
        if (available() < len.size)
            return finish(client_errc::incomplete_message);
        if (available() > len.size)
            return finish(client_errc::extra_bytes);
        payload_ = read(len.size);
        state_ = state_t::scalar_done;
        return result_type::chunk;
    }

    if (available() < protocol::plp_length_size)
        return finish(client_errc::incomplete_message);
    auto total = protocol::parse_plp_length(read(protocol::plp_length_size).first<protocol::plp_length_size>());
    if (total.is_null())
        return finish({});

    // The declared total is informational. Only the terminator ends the value
    state_ = state_t::chunks;
    return read_chunk();
}

chunk_reader::result_type chunk_reader::read_chunk()
{
    if (available() < protocol::plp_chunk_header_size)
        return finish(client_errc::plp_missing_terminator);
    auto chunk_length = protocol::parse_chunk_length(
        read(protocol::plp_chunk_header_size).first<protocol::plp_chunk_header_size>()
    );
    if (chunk_length == 0u)
        return finish(available() == 0u ? error_code() : error_code(client_errc::extra_bytes));
    if (available() < chunk_length)
        return finish(client_errc::plp_chunk_truncated);
    payload_ = read(chunk_length);
    return result_type::chunk;
}

chunk_reader::result_type chunk_reader::next()
{
    release_consumed();
    switch (state_)
    {
        case state_t::header: return read_header();
        case state_t::chunks: return read_chunk();
        case state_t::scalar_done: return finish({});
        case state_t::finished:
        default: return ec_ ? result_type::error : result_type::end;
    }
}

void chunk_reader::release() noexcept
{
    data_.release();
    offset_ = 0u;
    payload_ = {};
    state_ = state_t::finished;
}
