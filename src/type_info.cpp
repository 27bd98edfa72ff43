//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <string_view>

#include "nativetds/protocol/type_info.hpp"

using namespace nativetds::protocol;

std::string_view nativetds::protocol::to_string(sql_server_type t) noexcept
{
    switch (t)
    {
        case sql_server_type::tinyint: return "tinyint";
        case sql_server_type::smallint: return "smallint";
        case sql_server_type::int_: return "int";
        case sql_server_type::bigint: return "bigint";
        case sql_server_type::intn: return "intn";
        case sql_server_type::bit: return "bit";
        case sql_server_type::bitn: return "bitn";
        case sql_server_type::float_: return "float";
        case sql_server_type::floatn: return "floatn";
        case sql_server_type::guid: return "uniqueidentifier";
        case sql_server_type::decimal: return "decimal";
        case sql_server_type::date: return "date";
        case sql_server_type::datetime2: return "datetime2";
        case sql_server_type::char_: return "char";
        case sql_server_type::varchar: return "varchar";
        case sql_server_type::varcharmax: return "varchar(max)";
        case sql_server_type::nchar: return "nchar";
        case sql_server_type::nvarchar: return "nvarchar";
        case sql_server_type::nvarcharmax: return "nvarchar(max)";
        case sql_server_type::text: return "text";
        case sql_server_type::ntext: return "ntext";
        case sql_server_type::xml: return "xml";
        case sql_server_type::binary: return "binary";
        case sql_server_type::varbinary: return "varbinary";
        case sql_server_type::varbinarymax: return "varbinary(max)";
        case sql_server_type::image: return "image";
        default: return "<unknown sql_server_type>";
    }
}

std::string_view nativetds::protocol::to_string(length_strategy s) noexcept
{
    switch (s)
    {
        case length_strategy::fixed_len: return "FIXEDLENTYPE";
        case length_strategy::byte_len: return "BYTELENTYPE";
        case length_strategy::ushort_len: return "USHORTLENTYPE";
        case length_strategy::long_len: return "LONGLENTYPE";
        case length_strategy::part_len: return "PARTLENTYPE";
        default: return "<unknown length_strategy>";
    }
}

std::string_view nativetds::protocol::to_string(charset cs) noexcept
{
    switch (cs)
    {
        case charset::us_ascii: return "US-ASCII";
        case charset::iso_8859_1: return "ISO-8859-1";
        case charset::windows_1252: return "windows-1252";
        case charset::utf8: return "UTF-8";
        case charset::utf16le: return "UTF-16LE";
        default: return "<unknown charset>";
    }
}

bool type_info::is_character() const
{
    switch (server_type)
    {
        case sql_server_type::char_:
        case sql_server_type::varchar:
        case sql_server_type::varcharmax:
        case sql_server_type::nchar:
        case sql_server_type::nvarchar:
        case sql_server_type::nvarcharmax:
        case sql_server_type::text:
        case sql_server_type::ntext:
        case sql_server_type::xml: return true;
        default: return false;
    }
}

bool type_info::is_binary() const
{
    switch (server_type)
    {
        case sql_server_type::binary:
        case sql_server_type::varbinary:
        case sql_server_type::varbinarymax:
        case sql_server_type::image: return true;
        default: return false;
    }
}
