//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_PROTOCOL_LENGTH_HPP
#define NATIVETDS_PROTOCOL_LENGTH_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "nativetds/protocol/type_info.hpp"

namespace nativetds {

class receive_buffer;

namespace protocol {

// The decoded length descriptor of a scalar value
struct scalar_length
{
    std::uint32_t size{};
    bool is_null{};

    static scalar_length null() noexcept { return {0u, true}; }
    static scalar_length of(std::uint32_t size) noexcept { return {size, false}; }

    friend bool operator==(const scalar_length&, const scalar_length&) noexcept = default;
};

// The 8 byte total length that precedes a PLP value.
// Only informational: the chunk sequence is always read until its terminator.
struct plp_length
{
    static constexpr std::uint64_t null_marker = 0xFFFFFFFFFFFFFFFFull;
    static constexpr std::uint64_t unknown_marker = 0xFFFFFFFFFFFFFFFEull;

    std::uint64_t value{};

    static plp_length null() noexcept { return {null_marker}; }
    static plp_length unknown() noexcept { return {unknown_marker}; }
    static plp_length of(std::uint64_t size) noexcept { return {size}; }

    bool is_null() const noexcept { return value == null_marker; }
    bool is_unknown() const noexcept { return value == unknown_marker; }

    friend bool operator==(const plp_length&, const plp_length&) noexcept = default;
};

inline constexpr std::size_t plp_length_size = 8u;
inline constexpr std::size_t plp_chunk_header_size = 4u;

// Number of bytes taken by the scalar length descriptor of a value of the given type.
// For part_len, this is the size of a chunk header.
std::size_t descriptor_size(const type_info& type) noexcept;

// --- Parsing fixed-size wire representations ---
scalar_length parse_scalar_length(std::span<const unsigned char> descriptor, const type_info& type) noexcept;
plp_length parse_plp_length(std::span<const unsigned char, plp_length_size> from) noexcept;
std::uint32_t parse_chunk_length(std::span<const unsigned char, plp_chunk_header_size> from) noexcept;

// --- Cursor operations over a receive buffer ---
// The can_decode functions never move the cursor. The decode functions
// move it past the descriptor, and require the matching can_decode to have returned true.
bool scalar_can_decode(const receive_buffer& buff, const type_info& type) noexcept;
scalar_length scalar_decode(receive_buffer& buff, const type_info& type) noexcept;

bool plp_can_decode(const receive_buffer& buff) noexcept;
plp_length plp_decode(receive_buffer& buff) noexcept;

bool chunk_can_decode(const receive_buffer& buff) noexcept;
std::uint32_t chunk_decode(receive_buffer& buff) noexcept;

// --- Serialization. These append to the buffer and reproduce the wire bytes exactly ---
void encode(scalar_length len, const type_info& type, std::vector<unsigned char>& to);
void encode(plp_length len, std::vector<unsigned char>& to);
void encode_chunk(std::uint32_t len, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace nativetds

#endif
