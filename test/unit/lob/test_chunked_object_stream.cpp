//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "nativetds/buffer.hpp"
#include "nativetds/client_errc.hpp"
#include "nativetds/config.hpp"
#include "nativetds/lob/chunked_object_stream.hpp"
#include "nativetds/protocol/type_info.hpp"
#include "printing.hpp"
#include "test_utils.hpp"

using namespace nativetds;
using namespace nativetds::lob;
using namespace nativetds::protocol;
using boost::system::error_code;
using test::from_hex;
using test::make_plp_value;

namespace {

const type_info nvarcharmax = type_info_builder()
                                  .server_type(sql_server_type::nvarcharmax)
                                  .strategy(length_strategy::part_len)
                                  .max_length(0xffffu)
                                  .cs(charset::utf16le)
                                  .build();

const type_info varcharmax = type_info_builder()
                                 .server_type(sql_server_type::varcharmax)
                                 .strategy(length_strategy::part_len)
                                 .max_length(0xffffu)
                                 .cs(charset::windows_1252)
                                 .build();

const type_info varbinarymax = type_info_builder()
                                   .server_type(sql_server_type::varbinarymax)
                                   .strategy(length_strategy::part_len)
                                   .max_length(0xffffu)
                                   .build();

// "leanne.ashton@dd-pub.com,david.maassen@dd-pub.com" in UTF-16, split in two chunks.
// The 'o' of the first ".com" is split between them
const auto email_header = from_hex("62 00 00 00 00 00 00 00");
const auto email_chunk1 = from_hex(
    "2d 00 00 00 | 6c 00 65 00 61 00 6e 00 6e 00 65 00 2e 00 61 00 73 00 68 00 74 00 6f 00 6e 00 40 00 64 00 64 00 "
    "2d 00 70 00 75 00 62 00 2e 00 63 00 6f"
);
const auto email_chunk2 = from_hex(
    "35 00 00 00 | 00 6d 00 2c 00 64 00 61 00 76 00 69 00 64 00 2e 00 6d 00 61 00 61 00 73 00 73 00 65 00 6e 00 40 "
    "00 64 00 64 00 2d 00 70 00 75 00 62 00 2e 00 63 00 6f 00 6d 00"
);
const auto terminator = from_hex("00 00 00 00");

const auto abc_header = from_hex("18 00 00 00 00 00 00 00");
const auto abc_chunk1 = from_hex("08 00 00 00 | 43 31 78 78 78 78 78 78");  // C1xxxxxx
const auto abc_chunk2 = from_hex("08 00 00 00 | 43 32 79 79 79 79 79 79");  // C2yyyyyy
const auto abc_chunk3 = from_hex("08 00 00 00 | 43 33 7a 7a 7a 7a 7a 7a");  // C3zzzzzz

// Segment boundaries follow the chunks, and characters are realigned
void test_utf16_split_between_chunks()
{
    buffer_pool pool;
    {
        clob_stream stream(
            make_plp_value(pool, {email_header, email_chunk1, email_chunk2, terminator}),
            nvarcharmax
        );
        stream.request(2u);

        auto res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
        NATIVETDS_TEST_EQ(res.segment(), "leanne.ashton@dd-pub.c");

        // The first chunk's bytes are given back once decoded
        NATIVETDS_TEST_EQ(pool.outstanding(), 2u);

        res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
        NATIVETDS_TEST_EQ(res.segment(), "om,david.maassen@dd-pub.com");
        NATIVETDS_TEST_EQ(pool.outstanding(), 1u);

        // Demand is exhausted, but only the terminator is left
        NATIVETDS_TEST_EQ(stream.demand(), 0u);
        res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::end);
        NATIVETDS_TEST(stream.done());
        NATIVETDS_TEST(!stream.owns());
        NATIVETDS_TEST_EQ(pool.outstanding(), 0u);

        // Ending is sticky
        res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::end);
    }
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

// The bytes may be split at any point between components, as long as they're in order
void test_arbitrary_component_boundaries()
{
    const auto all = test::concat({email_header, email_chunk1, email_chunk2, terminator});
    std::span<const unsigned char> all_span(all);

    for (std::size_t i = 0; i <= all.size(); ++i)
    {
        test::context_frame frame("split at " + std::to_string(i));
        buffer_pool pool;
        {
            clob_stream stream(make_plp_value(pool, {all_span.first(i), all_span.subspan(i)}), nvarcharmax);
            std::string contents;
            NATIVETDS_TEST_EQ(read_all(stream, contents), error_code());
            NATIVETDS_TEST_EQ(contents, "leanne.ashton@dd-pub.com,david.maassen@dd-pub.com");
            NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
        }
    }
}

// The value ends before its terminator. Whatever was decoded is still emitted
void test_missing_terminator()
{
    buffer_pool pool;
    clob_stream stream(
        make_plp_value(pool, {from_hex("2d 00 00 00 00 00 00 00"), email_chunk1}),
        nvarcharmax,
        stream_config{10u}
    );

    auto res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(res.segment(), "leanne.ashton@dd-pub.c");

    res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
    NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::plp_missing_terminator));
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    NATIVETDS_TEST(stream.done());

    // Errors are sticky
    res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
    NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::plp_missing_terminator));
}

void test_chunk_truncated()
{
    buffer_pool pool;
    clob_stream stream(
        make_plp_value(pool, {abc_header, abc_chunk1, from_hex("08 00 00 00 | 43 32 79")}),
        varcharmax,
        stream_config{10u}
    );

    auto res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(res.segment(), "C1xxxxxx");

    res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
    NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::plp_chunk_truncated));
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

// Part of a chunk header doesn't count as a terminator
void test_partial_chunk_header()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, from_hex("00 00")}), varcharmax);
    std::string contents;
    NATIVETDS_TEST_EQ(read_all(stream, contents), error_code(client_errc::plp_missing_terminator));
    NATIVETDS_TEST_EQ(contents, "C1xxxxxx");
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

void test_incomplete_character()
{
    buffer_pool pool;
    clob_stream stream(
        make_plp_value(pool, {from_hex("03 00 00 00 00 00 00 00"), from_hex("03 00 00 00 | 61 00 62"), terminator}),
        nvarcharmax,
        stream_config{10u}
    );

    auto res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(res.segment(), "a");

    res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
    NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::incomplete_character));
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

void test_extra_bytes_after_terminator()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, terminator, from_hex("01")}), varcharmax);
    std::string contents;
    NATIVETDS_TEST_EQ(read_all(stream, contents), error_code(client_errc::extra_bytes));
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

// One segment per chunk, each consuming one unit of demand
void test_demand()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, abc_chunk2, abc_chunk3, terminator}), varcharmax);

    // No demand: nothing is read
    NATIVETDS_TEST_EQ(stream.demand(), 0u);
    auto res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::needs_demand);
    NATIVETDS_TEST_EQ(pool.outstanding(), 5u);

    stream.request(1u);
    res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(res.segment(), "C1xxxxxx");
    NATIVETDS_TEST_EQ(stream.demand(), 0u);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::needs_demand);

    stream.request(5u);
    res = stream.next();
    NATIVETDS_TEST_EQ(res.segment(), "C2yyyyyy");
    res = stream.next();
    NATIVETDS_TEST_EQ(res.segment(), "C3zzzzzz");
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    NATIVETDS_TEST_EQ(stream.demand(), 3u);
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

void test_initial_demand()
{
    buffer_pool pool;
    stream_config cfg;
    NATIVETDS_TEST_EQ(parse_config("InitialDemand=2", cfg), error_code());
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, abc_chunk2, abc_chunk3, terminator}), varcharmax, cfg);

    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::needs_demand);
}

// Cancelling after the first segment releases everything that's left
void test_cancel()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, abc_chunk2, abc_chunk3, terminator}), varcharmax);
    stream.request(1u);

    auto res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(res.segment(), "C1xxxxxx");
    NATIVETDS_TEST_EQ(stream.demand(), 0u);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::needs_demand);
    NATIVETDS_TEST_EQ(pool.outstanding(), 3u);

    stream.cancel();
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    NATIVETDS_TEST(stream.done());
    NATIVETDS_TEST(!stream.owns());

    res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
    NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::stream_cancelled));

    // Cancelling twice is fine
    stream.cancel();
    NATIVETDS_TEST_EQ(stream.next().error(), error_code(client_errc::stream_cancelled));
}

// Cancelling a finished stream doesn't change its outcome
void test_cancel_after_end()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, terminator}), varcharmax, stream_config{5u});
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::segment);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    stream.cancel();
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
}

void test_discard()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, abc_chunk2, terminator}), varcharmax);
    stream.discard();
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);

    stream.request(1u);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
}

// Discarding a NULL value completes it with no segments
void test_discard_null_value()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {from_hex("ff ff ff ff ff ff ff ff")}), varcharmax);
    NATIVETDS_TEST_EQ(pool.outstanding(), 1u);

    stream.discard();
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    NATIVETDS_TEST(stream.done());
    NATIVETDS_TEST(!stream.owns());
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    NATIVETDS_TEST_EQ(stream.demand(), 0u);
}

// Destroying an unfinished stream releases its data
void test_destroy_unfinished()
{
    buffer_pool pool;
    {
        clob_stream stream(make_plp_value(pool, {abc_header, abc_chunk1, abc_chunk2, terminator}), varcharmax);
        stream.request(1u);
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::segment);
    }
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

void test_empty_value()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {from_hex("00 00 00 00 00 00 00 00"), terminator}), varcharmax);
    stream.request(1u);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

void test_null_value()
{
    buffer_pool pool;
    clob_stream stream(make_plp_value(pool, {from_hex("ff ff ff ff ff ff ff ff")}), varcharmax);
    stream.request(1u);
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    NATIVETDS_TEST_EQ(stream.demand(), 1u);
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

// Values without chunks complete immediately, even if nothing was requested
void test_no_chunks_without_demand()
{
    // NULL
    {
        buffer_pool pool;
        clob_stream stream(make_plp_value(pool, {from_hex("ff ff ff ff ff ff ff ff")}), varcharmax);
        NATIVETDS_TEST_EQ(stream.demand(), 0u);
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
        NATIVETDS_TEST(stream.done());
        NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    }

    // Empty, the terminator split from the header
    {
        buffer_pool pool;
        clob_stream stream(
            make_plp_value(pool, {from_hex("00 00 00 00 00 00 00 00 | 00 00"), from_hex("00 00")}),
            varcharmax
        );
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
        NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    }

    // Malformed values report their error
    {
        buffer_pool pool;
        clob_stream stream(make_plp_value(pool, {abc_header, from_hex("08 00 00 00 | 43")}), varcharmax);
        auto res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
        NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::plp_chunk_truncated));
        NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    }

    // A chunk pending requires demand, even if it's split between components
    {
        buffer_pool pool;
        clob_stream stream(
            make_plp_value(pool, {abc_header, from_hex("08 00"), from_hex("00 00 | 43 31 78"), from_hex("78 78 78 78 78"), terminator}),
            varcharmax
        );
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::needs_demand);
        NATIVETDS_TEST_EQ(pool.outstanding(), 5u);
        stream.request(1u);
        auto res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
        NATIVETDS_TEST_EQ(res.segment(), "C1xxxxxx");
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
        NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
    }

    // Scalars
    {
        const auto varchar = type_info_builder()
                                 .server_type(sql_server_type::varchar)
                                 .strategy(length_strategy::ushort_len)
                                 .max_length(20u)
                                 .cs(charset::windows_1252)
                                 .build();
        buffer_pool pool;
        clob_stream empty(test::make_scalar_value(pool, from_hex("00 00")), varchar);
        NATIVETDS_TEST_EQ(empty.next().type(), stream_result_type::end);
        clob_stream non_empty(test::make_scalar_value(pool, from_hex("01 00 61")), varchar);
        NATIVETDS_TEST_EQ(non_empty.next().type(), stream_result_type::needs_demand);
        NATIVETDS_TEST_EQ(pool.outstanding(), 1u);
    }
}

// The declared length is informational
void test_unknown_length()
{
    buffer_pool pool;
    clob_stream stream(
        make_plp_value(pool, {from_hex("fe ff ff ff ff ff ff ff"), abc_chunk1, abc_chunk2, terminator}),
        varcharmax
    );
    std::string contents;
    NATIVETDS_TEST_EQ(read_all(stream, contents), error_code());
    NATIVETDS_TEST_EQ(contents, "C1xxxxxxC2yyyyyy");
}

// Non-PLP values stream as a single segment
void test_scalar_value()
{
    const auto nvarchar = type_info_builder()
                              .server_type(sql_server_type::nvarchar)
                              .strategy(length_strategy::ushort_len)
                              .max_length(20u)
                              .cs(charset::utf16le)
                              .build();
    buffer_pool pool;

    {
        clob_stream stream(test::make_scalar_value(pool, from_hex("06 00 61 00 62 00 63 00")), nvarchar);
        stream.request(5u);
        auto res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
        NATIVETDS_TEST_EQ(res.segment(), "abc");
        NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    }

    // Empty values produce no segments
    {
        clob_stream stream(test::make_scalar_value(pool, from_hex("00 00")), nvarchar);
        stream.request(5u);
        NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    }

    // Length mismatches are reported
    {
        clob_stream stream(test::make_scalar_value(pool, from_hex("06 00 61 00")), nvarchar);
        stream.request(5u);
        auto res = stream.next();
        NATIVETDS_TEST_EQ(res.type(), stream_result_type::error);
        NATIVETDS_TEST_EQ(res.error(), error_code(client_errc::incomplete_message));
    }
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

void test_blob()
{
    buffer_pool pool;
    blob_stream stream(
        make_plp_value(pool, {from_hex("05 00 00 00 00 00 00 00"), from_hex("02 00 00 00 | 00 ff"), from_hex("03 00 00 00 | 01 02 03"), terminator}),
        varbinarymax,
        stream_config{10u}
    );

    auto res = stream.next();
    NATIVETDS_TEST_EQ(res.type(), stream_result_type::segment);
    NATIVETDS_TEST_CONT_EQ(res.segment(), from_hex("00 ff"));

    res = stream.next();
    NATIVETDS_TEST_CONT_EQ(res.segment(), from_hex("01 02 03"));
    NATIVETDS_TEST_EQ(stream.next().type(), stream_result_type::end);
    NATIVETDS_TEST_EQ(pool.outstanding(), 0u);
}

}  // namespace

int main()
{
    test_utf16_split_between_chunks();
    test_arbitrary_component_boundaries();
    test_missing_terminator();
    test_chunk_truncated();
    test_partial_chunk_header();
    test_incomplete_character();
    test_extra_bytes_after_terminator();
    test_demand();
    test_initial_demand();
    test_cancel();
    test_cancel_after_end();
    test_discard();
    test_discard_null_value();
    test_destroy_unfinished();
    test_empty_value();
    test_null_value();
    test_no_chunks_without_demand();
    test_unknown_length();
    test_scalar_value();
    test_blob();

    return boost::report_errors();
}
