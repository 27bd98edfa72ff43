//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_TEST_TEST_UTILS_TEST_UTILS_HPP
#define NATIVETDS_TEST_TEST_UTILS_TEST_UTILS_HPP

#include <boost/assert/source_location.hpp>
#include <boost/core/lightweight_test.hpp>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <span>
#include <string_view>
#include <vector>

#include "nativetds/buffer.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/receive_buffer.hpp"

namespace nativetds {
namespace test {

struct context_frame
{
    context_frame(boost::source_location loc = BOOST_CURRENT_LOCATION) : context_frame({}, loc) {}
    context_frame(std::string_view message, boost::source_location loc = BOOST_CURRENT_LOCATION);
    context_frame(const context_frame&) = delete;
    context_frame(context_frame&&) = delete;
    context_frame& operator=(const context_frame&) = delete;
    context_frame& operator=(context_frame&&) = delete;
    ~context_frame();
};

void print_context();

// Parses a string of hex bytes, like "2d 00 00 00 | 6c 00". Spaces and '|' are ignored
std::vector<unsigned char> from_hex(std::string_view hex);

// Concatenates byte sequences
std::vector<unsigned char> concat(std::initializer_list<std::span<const unsigned char>> parts);

// Creates a column value in the wire format, as the row decoder would produce it.
// Each part becomes a separate component, as if every chunk came in a different read
protocol::column_data make_plp_value(buffer_pool& pool, std::initializer_list<std::span<const unsigned char>> parts);
protocol::column_data make_scalar_value(buffer_pool& pool, std::span<const unsigned char> bytes);

// Writes bytes into a receive buffer, in pieces of at most piece_size bytes,
// calling on_piece after each one
template <class Fn>
void feed(receive_buffer& buff, std::span<const unsigned char> bytes, std::size_t piece_size, Fn&& on_piece)
{
    while (!bytes.empty())
    {
        auto n = bytes.size() < piece_size ? bytes.size() : piece_size;
        buff.append(bytes.first(n));
        bytes = bytes.subspan(n);
        on_piece();
    }
}

// Evaluates each container expression once, so temporaries stay valid while compared
template <class A, class B>
bool test_cont_eq(const char* file, int line, const char* function, const A& a, const B& b)
{
    return ::boost::detail::test_all_eq_impl(
        BOOST_LIGHTWEIGHT_TEST_OSTREAM,
        file,
        line,
        function,
        std::begin(a),
        std::end(a),
        std::begin(b),
        std::end(b)
    );
}

}  // namespace test
}  // namespace nativetds

#define NATIVETDS_TEST(a) \
    if (!BOOST_TEST(a))   \
        ::nativetds::test::print_context();

#define NATIVETDS_TEST_CONT_EQ(a, b)                                                                \
    if (!::nativetds::test::test_cont_eq(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, (a), (b))) \
        ::nativetds::test::print_context();

#define NATIVETDS_TEST_EQ(a, b) \
    if (!BOOST_TEST_EQ(a, b))   \
        ::nativetds::test::print_context();

#endif
