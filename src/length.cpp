//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/endian/detail/endian_store.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "nativetds/protocol/length.hpp"
#include "nativetds/protocol/type_info.hpp"
#include "nativetds/receive_buffer.hpp"

using namespace nativetds::protocol;

namespace {

constexpr std::uint8_t byte_len_null = 0x00u;
constexpr std::uint16_t ushort_len_null = 0xFFFFu;
constexpr std::uint32_t long_len_null = 0xFFFFFFFFu;

template <class IntType>
void add_integral(IntType value, std::vector<unsigned char>& to)
{
    unsigned char buff[sizeof(IntType)];
    boost::endian::endian_store<IntType, sizeof(IntType), boost::endian::order::little>(buff, value);
    to.insert(to.end(), buff, buff + sizeof(IntType));
}

}  // namespace

std::size_t nativetds::protocol::descriptor_size(const type_info& type) noexcept
{
    switch (type.strategy)
    {
        case length_strategy::fixed_len: return 0u;
        case length_strategy::byte_len: return 1u;
        case length_strategy::ushort_len: return 2u;
        case length_strategy::long_len: return 4u;
        case length_strategy::part_len: return plp_chunk_header_size;
        default: BOOST_ASSERT(false); return 0u;
    }
}

scalar_length nativetds::protocol::parse_scalar_length(
    std::span<const unsigned char> descriptor,
    const type_info& type
) noexcept
{
    BOOST_ASSERT(descriptor.size() >= descriptor_size(type));
    const unsigned char* p = descriptor.data();
    switch (type.strategy)
    {
        case length_strategy::fixed_len: return scalar_length::of(type.max_length);
        case length_strategy::byte_len:
        {
            auto v = *p;
            return v == byte_len_null ? scalar_length::null() : scalar_length::of(v);
        }
        case length_strategy::ushort_len:
        {
            auto v = boost::endian::load_little_u16(p);
            return v == ushort_len_null ? scalar_length::null() : scalar_length::of(v);
        }
        case length_strategy::long_len:
        {
            auto v = boost::endian::load_little_u32(p);
            return v == long_len_null ? scalar_length::null() : scalar_length::of(v);
        }
        case length_strategy::part_len: return scalar_length::of(boost::endian::load_little_u32(p));
        default: BOOST_ASSERT(false); return scalar_length::null();
    }
}

plp_length nativetds::protocol::parse_plp_length(std::span<const unsigned char, plp_length_size> from) noexcept
{
    return plp_length::of(boost::endian::load_little_u64(from.data()));
}

std::uint32_t nativetds::protocol::parse_chunk_length(
    std::span<const unsigned char, plp_chunk_header_size> from
) noexcept
{
    return boost::endian::load_little_u32(from.data());
}

bool nativetds::protocol::scalar_can_decode(const receive_buffer& buff, const type_info& type) noexcept
{
    return buff.readable_bytes() >= descriptor_size(type);
}

scalar_length nativetds::protocol::scalar_decode(receive_buffer& buff, const type_info& type) noexcept
{
    const auto size = descriptor_size(type);
    BOOST_ASSERT(buff.readable_bytes() >= size);
    auto res = parse_scalar_length(buff.readable().first(size), type);
    buff.skip(size);
    return res;
}

bool nativetds::protocol::plp_can_decode(const receive_buffer& buff) noexcept
{
    return buff.readable_bytes() >= plp_length_size;
}

plp_length nativetds::protocol::plp_decode(receive_buffer& buff) noexcept
{
    return plp_length::of(buff.read_integral<std::uint64_t>());
}

bool nativetds::protocol::chunk_can_decode(const receive_buffer& buff) noexcept
{
    return buff.readable_bytes() >= plp_chunk_header_size;
}

std::uint32_t nativetds::protocol::chunk_decode(receive_buffer& buff) noexcept
{
    return buff.read_integral<std::uint32_t>();
}

void nativetds::protocol::encode(scalar_length len, const type_info& type, std::vector<unsigned char>& to)
{
    switch (type.strategy)
    {
        case length_strategy::fixed_len: break;  // no descriptor on the wire
        case length_strategy::byte_len:
            BOOST_ASSERT(len.is_null || (len.size > 0u && len.size <= 0xFFu));
            to.push_back(len.is_null ? byte_len_null : static_cast<unsigned char>(len.size));
            break;
        case length_strategy::ushort_len:
            BOOST_ASSERT(len.is_null || len.size < ushort_len_null);
            add_integral<std::uint16_t>(len.is_null ? ushort_len_null : static_cast<std::uint16_t>(len.size), to);
            break;
        case length_strategy::long_len:
            add_integral<std::uint32_t>(len.is_null ? long_len_null : len.size, to);
            break;
        case length_strategy::part_len:
            // Chunk headers have no NULL representation
            BOOST_ASSERT(!len.is_null);
            add_integral<std::uint32_t>(len.size, to);
            break;
        default: BOOST_ASSERT(false);
    }
}

void nativetds::protocol::encode(plp_length len, std::vector<unsigned char>& to)
{
    add_integral<std::uint64_t>(len.value, to);
}

void nativetds::protocol::encode_chunk(std::uint32_t len, std::vector<unsigned char>& to)
{
    add_integral<std::uint32_t>(len, to);
}
