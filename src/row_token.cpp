//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "debug_log.hpp"
#include "nativetds/buffer.hpp"
#include "nativetds/client_errc.hpp"
#include "nativetds/protocol/length.hpp"
#include "nativetds/protocol/row_token.hpp"
#include "nativetds/receive_buffer.hpp"

using namespace nativetds;
using namespace nativetds::protocol;

namespace {

// --- Probing. These advance the cursor past the column on success. The caller restores it ---
bool probe_scalar(receive_buffer& buff, const type_info& type)
{
    if (!scalar_can_decode(buff, type))
        return false;
    auto len = scalar_decode(buff, type);
    if (len.is_null)
        return true;
    if (buff.readable_bytes() < len.size)
        return false;
    buff.skip(len.size);
    return true;
}

bool probe_plp(receive_buffer& buff)
{
    if (!plp_can_decode(buff))
        return false;
    auto total = plp_decode(buff);
    if (total.is_null())
        return true;

    // The declared total length might not match the chunks. Only the terminator ends the value
    while (true)
    {
        if (!chunk_can_decode(buff))
            return false;
        auto chunk_length = chunk_decode(buff);
        if (chunk_length == 0u)
            return true;
        if (buff.readable_bytes() < chunk_length)
            return false;
        buff.skip(chunk_length);
    }
}

bool probe_column(receive_buffer& buff, const column& col)
{
    return col.type.is_plp() ? probe_plp(buff) : probe_scalar(buff, col.type);
}

std::size_t null_bitmap_size(std::size_t num_columns) { return (num_columns + 7u) / 8u; }

// Is column i NULL, according to the bitmap that starts an NBCROW?
bool is_null_in_bitmap(std::span<const unsigned char> bitmap, std::size_t i)
{
    return (bitmap[i / 8u] & (1u << (i % 8u))) != 0u;
}

// --- Decoding ---
void check_available(const receive_buffer& buff, std::size_t n)
{
    if (buff.readable_bytes() < n)
    {
        NATIVETDS_LOG(1, "decode: needed %zu bytes but only %zu are available", n, buff.readable_bytes());
        BOOST_THROW_EXCEPTION(boost::system::system_error(client_errc::decode_precondition_violated));
    }
}

std::optional<column_data> decode_scalar(receive_buffer& buff, const type_info& type)
{
    const auto start = buff.reader_index();
    const auto descriptor = descriptor_size(type);
    check_available(buff, descriptor);
    auto len = scalar_decode(buff, type);
    if (len.is_null)
        return std::nullopt;
    check_available(buff, len.size);

    // The slice includes the length descriptor, so the value reaches codecs as it was on the wire
    buff.reset_reader_index(start);
    return column_data(buff.read_retained_slice(descriptor + len.size));
}

std::optional<column_data> decode_plp(receive_buffer& buff)
{
    check_available(buff, plp_length_size);
    auto total = parse_plp_length(buff.readable().first<plp_length_size>());
    if (total.is_null())
    {
        buff.skip(plp_length_size);
        return std::nullopt;
    }

    composite_slice res;
    res.add_component(buff.read_retained_slice(plp_length_size));
    std::size_t num_chunks = 0u;
    while (true)
    {
        check_available(buff, plp_chunk_header_size);
        auto chunk_length = parse_chunk_length(buff.readable().first<plp_chunk_header_size>());
        check_available(buff, plp_chunk_header_size + chunk_length);

        // Every chunk record, header included, is a component. So is the terminator
        res.add_component(buff.read_retained_slice(plp_chunk_header_size + chunk_length));
        if (chunk_length == 0u)
            break;
        ++num_chunks;
    }

    NATIVETDS_LOG(2, "decode: PLP value with %zu chunks, declared length %llu", num_chunks,
                  static_cast<unsigned long long>(total.value));
    return column_data(std::move(res));
}

std::optional<column_data> decode_column(receive_buffer& buff, const column& col)
{
    return col.type.is_plp() ? decode_plp(buff) : decode_scalar(buff, col.type);
}

}  // namespace

// --- row_token ---
void row_token::set(std::size_t index, column_data data)
{
    auto& s = slots_.at(index);
    BOOST_ASSERT(s.state == slot_state::null);
    s.data = std::move(data);
    s.state = slot_state::owned;
}

const column_data* row_token::get(std::size_t index) const
{
    const auto& s = slots_.at(index);
    return s.state == slot_state::owned ? &s.data : nullptr;
}

std::optional<column_data> row_token::take(std::size_t index)
{
    auto& s = slots_.at(index);
    switch (s.state)
    {
        case slot_state::null: return std::nullopt;
        case slot_state::owned:
        {
            std::optional<column_data> res(std::move(s.data));
            s.data = byte_slice();
            s.state = slot_state::transferred;
            return res;
        }
        case slot_state::transferred:
            BOOST_THROW_EXCEPTION(std::logic_error("row_token::take: column data was already transferred"));
        case slot_state::released:
        default: BOOST_THROW_EXCEPTION(std::logic_error("row_token::take: the row has been released"));
    }
}

std::size_t row_token::owned_count() const noexcept
{
    std::size_t res = 0u;
    for (const auto& s : slots_)
    {
        if (s.state == slot_state::owned)
            ++res;
    }
    return res;
}

void row_token::release() noexcept
{
    for (auto& s : slots_)
    {
        if (s.state == slot_state::owned)
        {
            s.data = byte_slice();
            s.state = slot_state::released;
        }
    }
}

// --- Free functions ---
std::size_t nativetds::protocol::wire_size(const column_data& data) noexcept
{
    return boost::variant2::visit([](const auto& v) { return v.size(); }, data);
}

std::vector<unsigned char> nativetds::protocol::to_wire_bytes(const column_data& data)
{
    if (const auto* s = boost::variant2::get_if<byte_slice>(&data))
    {
        auto bytes = s->data();
        return {bytes.begin(), bytes.end()};
    }
    return boost::variant2::get<composite_slice>(data).to_vector();
}

bool nativetds::protocol::can_decode(receive_buffer& buff, std::span<const column> columns)
{
    const auto saved = buff.reader_index();
    bool res = true;
    for (const auto& col : columns)
    {
        if (!probe_column(buff, col))
        {
            res = false;
            break;
        }
    }
    buff.reset_reader_index(saved);
    return res;
}

row_token nativetds::protocol::decode(receive_buffer& buff, std::span<const column> columns)
{
    row_token res(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i)
    {
        auto data = decode_column(buff, columns[i]);
        if (data)
            res.set(i, std::move(*data));
    }
    NATIVETDS_LOG(1, "decode: ROW with %zu columns, %zu non-NULL", columns.size(), res.owned_count());
    return res;
}

bool nativetds::protocol::nbc_can_decode(receive_buffer& buff, std::span<const column> columns)
{
    if (buff.readable_bytes() < null_bitmap_size(columns.size()))
        return false;

    // Probing doesn't move bytes, so the bitmap stays valid while we advance past it
    const auto saved = buff.reader_index();
    const auto bitmap = buff.readable().first(null_bitmap_size(columns.size()));
    buff.skip(bitmap.size());
    bool res = true;
    for (std::size_t i = 0; i < columns.size(); ++i)
    {
        if (!is_null_in_bitmap(bitmap, i) && !probe_column(buff, columns[i]))
        {
            res = false;
            break;
        }
    }
    buff.reset_reader_index(saved);
    return res;
}

row_token nativetds::protocol::nbc_decode(receive_buffer& buff, std::span<const column> columns)
{
    check_available(buff, null_bitmap_size(columns.size()));
    const auto bitmap = buff.readable().first(null_bitmap_size(columns.size()));
    buff.skip(bitmap.size());
    row_token res(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i)
    {
        if (is_null_in_bitmap(bitmap, i))
            continue;
        auto data = decode_column(buff, columns[i]);
        if (data)
            res.set(i, std::move(*data));
    }
    NATIVETDS_LOG(1, "decode: NBCROW with %zu columns, %zu non-NULL", columns.size(), res.owned_count());
    return res;
}
