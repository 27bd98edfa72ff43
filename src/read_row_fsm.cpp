//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include "debug_log.hpp"
#include "nativetds/client_errc.hpp"
#include "nativetds/protocol/read_row_fsm.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/receive_buffer.hpp"

using namespace nativetds;
using namespace nativetds::protocol;

read_row_fsm::result read_row_fsm::resume(receive_buffer& buff)
{
    // Do we have the token type?
    if (buff.readable_bytes() < 1u)
        return result_type::needs_more;

    const unsigned char token_type = buff.readable()[0];
    if (token_type != row_token_type && token_type != nbc_row_token_type)
    {
        NATIVETDS_LOG(1, "read_row_fsm: unexpected token type 0x%02X", static_cast<unsigned>(token_type));
        return boost::system::error_code(client_errc::unexpected_token);
    }

    // Do we have the entire token?
    const auto saved = buff.reader_index();
    buff.skip(1u);
    const bool complete = token_type == row_token_type ? can_decode(buff, columns_)
                                                       : nbc_can_decode(buff, columns_);
    if (!complete)
    {
        buff.reset_reader_index(saved);
        NATIVETDS_LOG(2, "read_row_fsm: incomplete token, %zu bytes available", buff.readable_bytes());
        return result_type::needs_more;
    }

    return token_type == row_token_type ? decode(buff, columns_) : nbc_decode(buff, columns_);
}
