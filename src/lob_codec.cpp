//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

#include <cstddef>
#include <optional>
#include <utility>

#include "debug_log.hpp"
#include "nativetds/client_errc.hpp"
#include "nativetds/lob/lob_codec.hpp"

using namespace nativetds;
using namespace nativetds::lob;

namespace {

void check_type(bool ok, const protocol::type_info& type)
{
    if (!ok)
    {
        const auto type_name = protocol::to_string(type.server_type);
        NATIVETDS_LOG(1, "lob: can't decode a value of type %.*s", static_cast<int>(type_name.size()), type_name.data());
        BOOST_THROW_EXCEPTION(boost::system::system_error(client_errc::decode_precondition_violated));
    }
}

template <class Codec, class Lob>
std::optional<Lob> decode_from_row(
    protocol::row_token& row,
    std::size_t index,
    const protocol::type_info& type,
    const stream_config& cfg
)
{
    check_type(Codec::can_decode(type), type);
    auto data = row.take(index);
    if (!data)
        return std::nullopt;
    return Codec::decode(std::move(*data), type, cfg);
}

}  // namespace

bool clob_codec::can_decode(const protocol::type_info& type) noexcept { return type.is_character(); }

clob clob_codec::decode(protocol::column_data data, const protocol::type_info& type, const stream_config& cfg)
{
    check_type(can_decode(type), type);
    return clob(std::move(data), type, cfg);
}

std::optional<clob> clob_codec::decode(
    protocol::row_token& row,
    std::size_t index,
    const protocol::type_info& type,
    const stream_config& cfg
)
{
    return decode_from_row<clob_codec, clob>(row, index, type, cfg);
}

bool blob_codec::can_decode(const protocol::type_info& type) noexcept { return type.is_binary(); }

blob blob_codec::decode(protocol::column_data data, const protocol::type_info& type, const stream_config& cfg)
{
    check_type(can_decode(type), type);
    return blob(std::move(data), type, cfg);
}

std::optional<blob> blob_codec::decode(
    protocol::row_token& row,
    std::size_t index,
    const protocol::type_info& type,
    const stream_config& cfg
)
{
    return decode_from_row<blob_codec, blob>(row, index, type, cfg);
}
