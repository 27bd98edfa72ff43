//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_PROTOCOL_READ_ROW_FSM_HPP
#define NATIVETDS_PROTOCOL_READ_ROW_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <utility>

#include "nativetds/protocol/row_token.hpp"
#include "nativetds/protocol/type_info.hpp"

namespace nativetds {

class receive_buffer;

namespace protocol {

// A finite-state machine type to read ROW and NBCROW tokens from the server.
// resume() returns a variant-like type specifying what to do next.
// Flow should be:
//   - Create an FSM per result set, passing the columns from COLMETADATA.
//     They must outlive the FSM.
//   - Call resume() passing the connection's receive buffer.
//   - If resume returns needs_more, the buffer doesn't contain an entire token.
//     Read more data into the buffer and call resume again. The cursor wasn't moved.
//   - If resume returns a row, the cursor was moved past the token. The row owns its
//     column data, so the buffer can be written to (and read bytes discarded) freely.
//   - If resume returns an error, the next token isn't a row. The cursor wasn't moved.
class read_row_fsm
{
    std::span<const column> columns_;

public:
    enum class result_type
    {
        needs_more,
        error,
        row,
    };

    class result
    {
    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::error), ec_(ec) {}
        result(result_type t) noexcept : type_(t) { BOOST_ASSERT(t == result_type::needs_more); }
        result(row_token row) noexcept : type_(result_type::row), row_(std::move(row)) {}

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::error);
            return ec_;
        }

        row_token& row()
        {
            BOOST_ASSERT(type_ == result_type::row);
            return row_;
        }

    private:
        result_type type_;
        boost::system::error_code ec_;
        row_token row_;
    };

    explicit read_row_fsm(std::span<const column> columns) noexcept : columns_(columns) {}

    std::span<const column> columns() const noexcept { return columns_; }

    result resume(receive_buffer& buff);
};

}  // namespace protocol
}  // namespace nativetds

#endif
