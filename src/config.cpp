//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "debug_log.hpp"
#include "nativetds/client_errc.hpp"
#include "nativetds/config.hpp"
#include "nativetds/misc/params.hpp"

using namespace nativetds;
using boost::system::error_code;

namespace {

// Sets to if name is present. Leaves it untouched otherwise
error_code get_size(
    const std::vector<misc::name_value_pair>& pairs,
    std::string_view name,
    std::size_t min_value,
    std::size_t& to
)
{
    auto value = misc::find_value_case_insensitive(pairs, name);
    if (!value)
        return {};

    std::size_t res{};
    const char* first = value->data();
    const char* last = first + value->size();
    auto conv = std::from_chars(first, last, res);
    if (conv.ec != std::errc() || conv.ptr != last || res < min_value)
    {
        NATIVETDS_LOG(1, "config: invalid value for %.*s: '%s'", static_cast<int>(name.size()), name.data(),
                      value->c_str());
        return client_errc::invalid_config_value;
    }

    to = res;
    return {};
}

}  // namespace

error_code nativetds::parse_config(std::string_view input, buffer_pool_config& to)
{
    auto pairs = misc::parse_string_to_pairs(input);

    // Parse into a copy, so to is untouched on error
    buffer_pool_config res = to;
    if (auto ec = get_size(pairs, "BlockSize", 1u, res.block_size))
        return ec;
    if (auto ec = get_size(pairs, "MaxPooledBlocks", 0u, res.max_pooled_blocks))
        return ec;
    to = res;
    return {};
}

error_code nativetds::parse_config(std::string_view input, stream_config& to)
{
    auto pairs = misc::parse_string_to_pairs(input);
    stream_config res = to;
    if (auto ec = get_size(pairs, "InitialDemand", 0u, res.initial_demand))
        return ec;
    to = res;
    return {};
}
