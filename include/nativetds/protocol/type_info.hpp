//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_PROTOCOL_TYPE_INFO_HPP
#define NATIVETDS_PROTOCOL_TYPE_INFO_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace nativetds {
namespace protocol {

// How the size of a value is encoded in a row
enum class length_strategy : std::uint8_t
{
    fixed_len,   // no length descriptor. The value has max_length bytes and can't be NULL
    byte_len,    // 1 byte length. 0 means NULL
    ushort_len,  // 2 byte length. 0xFFFF means NULL
    long_len,    // 4 byte length. 0xFFFFFFFF means NULL
    part_len,    // partially length-prefixed (PLP). An 8 byte total length followed by chunks
};

// Server-side data types, by their TDS type byte. MAX types share the type byte
// with their non-MAX counterparts on the wire, and are told apart by the length strategy.
enum class sql_server_type : std::uint8_t
{
    tinyint,
    smallint,
    int_,
    bigint,
    intn,
    bit,
    bitn,
    float_,
    floatn,
    guid,
    decimal,
    date,
    datetime2,
    char_,
    varchar,
    varcharmax,
    nchar,
    nvarchar,
    nvarcharmax,
    text,
    ntext,
    xml,
    binary,
    varbinary,
    varbinarymax,
    image,
};

// Character sets that text columns may use. Non-Unicode columns get theirs from the collation.
enum class charset : std::uint8_t
{
    us_ascii,
    iso_8859_1,
    windows_1252,
    utf8,
    utf16le,
};

std::string_view to_string(sql_server_type t) noexcept;
std::string_view to_string(length_strategy s) noexcept;
std::string_view to_string(charset cs) noexcept;

// Static type metadata for a result column, as described by COLMETADATA
struct type_info
{
    sql_server_type server_type{sql_server_type::varchar};
    length_strategy strategy{length_strategy::ushort_len};
    std::uint32_t max_length{};
    charset cs{charset::windows_1252};
    std::uint8_t precision{};
    std::uint8_t scale{};

    bool is_plp() const { return strategy == length_strategy::part_len; }

    bool is_character() const;
    bool is_binary() const;
};

struct column
{
    std::string name;
    type_info type;
};

// Fluent construction, to keep call sites readable when only a few fields matter
class type_info_builder
{
    type_info res_;

public:
    type_info_builder() = default;

    type_info_builder& server_type(sql_server_type v)
    {
        res_.server_type = v;
        return *this;
    }

    type_info_builder& strategy(length_strategy v)
    {
        res_.strategy = v;
        return *this;
    }

    type_info_builder& max_length(std::uint32_t v)
    {
        res_.max_length = v;
        return *this;
    }

    type_info_builder& cs(charset v)
    {
        res_.cs = v;
        return *this;
    }

    type_info_builder& precision(std::uint8_t v)
    {
        res_.precision = v;
        return *this;
    }

    type_info_builder& scale(std::uint8_t v)
    {
        res_.scale = v;
        return *this;
    }

    type_info build() const { return res_; }
};

}  // namespace protocol
}  // namespace nativetds

#endif
