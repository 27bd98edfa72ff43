//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_CONFIG_HPP
#define NATIVETDS_CONFIG_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <string_view>

namespace nativetds {

// Tuning for buffer_pool
struct buffer_pool_config
{
    // Minimum size of the blocks the pool allocates. Bigger requests get a bigger block
    std::size_t block_size{8192};

    // How many free blocks are kept for reuse. Blocks released past this are freed
    std::size_t max_pooled_blocks{16};
};

// Tuning for large object streams
struct stream_config
{
    // Demand that a stream starts with, before the consumer calls request()
    std::size_t initial_demand{0};
};

// Parse a "Key=Value;Key2=Value2" string. Keys are case insensitive and unknown keys are ignored.
// Values may reference environment variables as ${VAR}, $VAR or %VAR%.
//   buffer_pool_config: BlockSize, MaxPooledBlocks
//   stream_config: InitialDemand
// Fields not present in the string keep their current value.
[[nodiscard]] boost::system::error_code parse_config(std::string_view input, buffer_pool_config& to);
[[nodiscard]] boost::system::error_code parse_config(std::string_view input, stream_config& to);

}  // namespace nativetds

#endif
