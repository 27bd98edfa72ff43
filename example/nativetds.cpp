//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Reads ROW and NBCROW tokens from stdin and prints them.
// The result set has two columns: id (int NOT NULL) and doc (nvarchar(max)).
// Large values are streamed segment by segment, as they were sent.
//
// Usage:
//   xxd -r -p example/sample_rows.hex | ./nativetds_example
//
// Tuning may be passed in the NATIVETDS_CONFIG environment variable, e.g.
//   NATIVETDS_CONFIG="BlockSize=64;InitialDemand=1"

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include "nativetds/buffer.hpp"
#include "nativetds/config.hpp"
#include "nativetds/lob/chunked_object_stream.hpp"
#include "nativetds/lob/lob_codec.hpp"
#include "nativetds/protocol/read_row_fsm.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/protocol/type_info.hpp"
#include "nativetds/receive_buffer.hpp"

namespace asio = boost::asio;
using namespace nativetds;
using boost::system::error_code;

static const std::vector<protocol::column> columns{
    {"id",
     protocol::type_info_builder()
         .server_type(protocol::sql_server_type::int_)
         .strategy(protocol::length_strategy::fixed_len)
         .max_length(4u)
         .build()},
    {"doc",
     protocol::type_info_builder()
         .server_type(protocol::sql_server_type::nvarcharmax)
         .strategy(protocol::length_strategy::part_len)
         .max_length(0xffffu)
         .cs(protocol::charset::utf16le)
         .build()},
};

static void check(error_code ec)
{
    if (ec)
        BOOST_THROW_EXCEPTION(boost::system::system_error(ec));
}

static void print_row(protocol::row_token& row, const stream_config& cfg)
{
    auto id_bytes = protocol::to_wire_bytes(*row.get(0));
    std::cout << "Got row: id=" << boost::endian::load_little_s32(id_bytes.data()) << ", doc=";

    auto doc = lob::clob_codec::decode(row, 1u, columns[1].type, cfg);
    row.release();
    if (!doc)
    {
        std::cout << "NULL\n";
        return;
    }

    // Print each segment as soon as we get it
    auto stream = doc->stream();
    while (true)
    {
        auto res = stream.next();
        switch (res.type())
        {
            case lob::stream_result_type::segment: std::cout << '[' << res.segment() << ']'; break;
            case lob::stream_result_type::needs_demand: stream.request(1u); break;
            case lob::stream_result_type::end: std::cout << '\n'; return;
            case lob::stream_result_type::error:
            default: check(res.error());
        }
    }
}

static asio::awaitable<void> co_main(buffer_pool_config pool_cfg, stream_config stream_cfg)
{
    asio::posix::stream_descriptor input{co_await asio::this_coro::executor, ::dup(STDIN_FILENO)};
    buffer_pool pool(pool_cfg);
    receive_buffer buff(pool);
    protocol::read_row_fsm fsm(columns);
    std::size_t num_rows = 0u;

    while (true)
    {
        auto act = fsm.resume(buff);
        if (act.type() == protocol::read_row_fsm::result_type::row)
        {
            ++num_rows;
            print_row(act.row(), stream_cfg);
            buff.discard_read_bytes();
            continue;
        }
        else if (act.type() == protocol::read_row_fsm::result_type::error)
        {
            std::cout << "Stopping at a token that is not a row: " << act.error().message() << '\n';
            break;
        }

        // Read as much as is available. Tokens may arrive in any number of pieces
        error_code ec;
        auto to = buff.prepare(512u);
        std::size_t bytes_read = co_await input.async_read_some(
            asio::buffer(to.data(), to.size()),
            asio::redirect_error(asio::use_awaitable, ec)
        );
        if (ec == asio::error::eof)
        {
            if (buff.readable_bytes() != 0u)
                std::cout << "Input ended in the middle of a row (" << buff.readable_bytes() << " bytes left)\n";
            break;
        }
        check(ec);
        buff.commit(bytes_read);
    }

    std::cout << "Done: " << num_rows << " rows\n";
}

int main()
{
    buffer_pool_config pool_cfg;
    stream_config stream_cfg;
    if (const char* cfg = std::getenv("NATIVETDS_CONFIG"))
    {
        check(parse_config(cfg, pool_cfg));
        check(parse_config(cfg, stream_cfg));
    }

    asio::io_context ctx;

    asio::co_spawn(ctx, co_main(pool_cfg, stream_cfg), [](std::exception_ptr exc) {
        if (exc)
            std::rethrow_exception(exc);
    });

    ctx.run();
}
