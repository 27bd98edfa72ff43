//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_SRC_DEBUG_LOG_HPP
#define NATIVETDS_SRC_DEBUG_LOG_HPP

// Protocol tracing, controlled by the NATIVETDS_DEBUG environment variable:
//   0 or unset: off
//   1: row and stream events
//   2: per-column and per-chunk detail

#include <cstdio>
#include <cstdlib>

namespace nativetds {
namespace detail {

inline int debug_level()
{
    static const int level = [] {
        const char* env = std::getenv("NATIVETDS_DEBUG");
        return env ? std::atoi(env) : 0;
    }();
    return level;
}

}  // namespace detail
}  // namespace nativetds

#define NATIVETDS_LOG(lvl, fmt, ...)                                         \
    do                                                                       \
    {                                                                        \
        if (::nativetds::detail::debug_level() >= (lvl))                     \
            std::fprintf(stderr, "[nativetds] " fmt "\n", ##__VA_ARGS__);     \
    } while (0)

#endif
