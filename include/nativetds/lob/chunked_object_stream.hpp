//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_LOB_CHUNKED_OBJECT_STREAM_HPP
#define NATIVETDS_LOB_CHUNKED_OBJECT_STREAM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <utility>
#include <vector>

#include "nativetds/client_errc.hpp"
#include "nativetds/config.hpp"
#include "nativetds/lob/chunk_reader.hpp"
#include "nativetds/lob/segment_decoder.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/protocol/type_info.hpp"

namespace nativetds {
namespace lob {

// What basic_chunked_object_stream::next() produced
enum class stream_result_type
{
    segment,       // a decoded segment is available
    needs_demand,  // no demand is outstanding. Call request()
    end,           // no more segments. Nothing is owned anymore
    error,         // the value is malformed, or the stream was cancelled. Nothing is owned anymore
};

// A pull-based stream over the contents of a large object. Segments are produced
// one per chunk on the wire, decoded by Decoder (see segment_decoder.hpp).
// Flow should be:
//   - Call request(n) to allow the stream to produce up to n more segments
//   - Call next() until it returns end or error.
//   - If next() returns needs_demand, call request() before calling next() again.
//     A NULL value, or one with only its terminator left, ends without demand.
//   - If next() returns a segment, it's yours. It doesn't point into the network buffer.
//   - cancel() or discard() can be called at any time. Any remaining data is released.
// The stream owns the column data. Each chunk's bytes are released once they've been decoded.
// When the stream ends, or fails, it no longer owns anything.
template <class Decoder>
class basic_chunked_object_stream
{
public:
    using segment_type = typename Decoder::segment_type;

    using result_type = stream_result_type;

    class result
    {
    public:
        result(result_type t) noexcept : type_(t) { BOOST_ASSERT(t == result_type::needs_demand || t == result_type::end); }
        result(boost::system::error_code ec) noexcept : type_(result_type::error), ec_(ec) {}
        result(segment_type seg) noexcept : type_(result_type::segment), seg_(std::move(seg)) {}

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::error);
            return ec_;
        }

        const segment_type& segment() const&
        {
            BOOST_ASSERT(type_ == result_type::segment);
            return seg_;
        }

        segment_type&& segment() &&
        {
            BOOST_ASSERT(type_ == result_type::segment);
            return std::move(seg_);
        }

    private:
        result_type type_;
        boost::system::error_code ec_;
        segment_type seg_;
    };

private:
    enum class state_t
    {
        active,
        ended,
        failed,
        cancelled,
    };

    detail::chunk_reader reader_;
    Decoder decoder_;
    std::size_t demand_;
    state_t state_{state_t::active};
    boost::system::error_code ec_;

    result fail(boost::system::error_code ec)
    {
        reader_.release();
        state_ = state_t::failed;
        ec_ = ec;
        return ec;
    }

public:
    basic_chunked_object_stream(
        protocol::column_data data,
        const protocol::type_info& type,
        const stream_config& cfg = {}
    )
        : reader_(std::move(data), type), decoder_(type), demand_(cfg.initial_demand)
    {
    }

    basic_chunked_object_stream(const basic_chunked_object_stream&) = delete;
    basic_chunked_object_stream& operator=(const basic_chunked_object_stream&) = delete;
    basic_chunked_object_stream(basic_chunked_object_stream&&) = default;
    basic_chunked_object_stream& operator=(basic_chunked_object_stream&&) = default;
    ~basic_chunked_object_stream() = default;

    // Allows the stream to produce n more segments
    void request(std::size_t n) noexcept { demand_ += n; }
    std::size_t demand() const noexcept { return demand_; }

    // Has the stream ended, failed or been cancelled?
    bool done() const noexcept { return state_ != state_t::active; }

    // Does the stream still own any column data?
    bool owns() const noexcept { return reader_.owns(); }

    result next()
    {
        switch (state_)
        {
            case state_t::ended: return result_type::end;
            case state_t::failed: return ec_;
            case state_t::cancelled: return boost::system::error_code(client_errc::stream_cancelled);
            default: break;
        }

        while (true)
        {
            // Demand paces segments. A value with no chunks left completes without it
            if (demand_ == 0u && reader_.chunk_ahead())
                return result_type::needs_demand;

            switch (reader_.next())
            {
                case detail::chunk_reader::result_type::chunk:
                {
                    segment_type seg;
                    auto ec = decoder_.decode(reader_.payload(), seg);
                    reader_.release_consumed();
                    if (ec)
                        return fail(ec);

                    // A chunk holding only part of a character produces nothing
                    if (seg.empty())
                        continue;
                    BOOST_ASSERT(demand_ > 0u);
                    --demand_;
                    return result(std::move(seg));
                }
                case detail::chunk_reader::result_type::end:
                {
                    auto ec = decoder_.finish();
                    if (ec)
                        return fail(ec);
                    state_ = state_t::ended;
                    return result_type::end;
                }
                case detail::chunk_reader::result_type::error:
                default: return fail(reader_.error());
            }
        }
    }

    // Stops the stream, releasing everything not yet consumed. Further calls to next() fail
    // with client_errc::stream_cancelled. Calling it more than once has no effect
    void cancel() noexcept
    {
        reader_.release();
        if (state_ == state_t::active)
            state_ = state_t::cancelled;
    }

    // Releases the value without decoding it. The stream ends with no more segments
    void discard() noexcept
    {
        reader_.release();
        if (state_ == state_t::active)
            state_ = state_t::ended;
    }
};

using clob_stream = basic_chunked_object_stream<text_decoder>;
using blob_stream = basic_chunked_object_stream<binary_decoder>;

// Reads the remaining contents of the stream, requesting demand as required.
// Returns the concatenation of all segments
template <class Decoder>
boost::system::error_code read_all(
    basic_chunked_object_stream<Decoder>& stream,
    typename Decoder::segment_type& to
)
{
    while (true)
    {
        auto res = stream.next();
        switch (res.type())
        {
            case stream_result_type::segment:
            {
                const auto& seg = res.segment();
                to.insert(to.end(), seg.begin(), seg.end());
                break;
            }
            case stream_result_type::needs_demand: stream.request(1u); break;
            case stream_result_type::end: return {};
            case stream_result_type::error:
            default: return res.error();
        }
    }
}

}  // namespace lob
}  // namespace nativetds

#endif
