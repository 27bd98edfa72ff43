//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_PROTOCOL_ROW_TOKEN_HPP
#define NATIVETDS_PROTOCOL_ROW_TOKEN_HPP

#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "nativetds/buffer.hpp"
#include "nativetds/protocol/type_info.hpp"

namespace nativetds {

class receive_buffer;

namespace protocol {

// Token type bytes
inline constexpr unsigned char row_token_type = 0xD1;
inline constexpr unsigned char nbc_row_token_type = 0xD2;

// The wire bytes of a single non-NULL column value, length descriptors included.
// Scalar values are a single slice. PLP values are a composite made of the total length,
// every chunk (header and payload) and the terminator chunk, in wire order.
using column_data = boost::variant2::variant<byte_slice, composite_slice>;

// One decoded row. Owns the data of every column until the row is released,
// or until ownership of a column is transferred out with take().
class row_token
{
public:
    enum class slot_state
    {
        null,         // the column is NULL. There's nothing to own
        owned,        // the row owns the column data
        transferred,  // the column data was taken out. Its new owner releases it
        released,     // the row was released while owning the column data
    };

private:
    struct slot
    {
        slot_state state{slot_state::null};
        column_data data;
    };

    std::vector<slot> slots_;

public:
    row_token() = default;
    explicit row_token(std::size_t num_columns) : slots_(num_columns) {}
    row_token(const row_token&) = delete;
    row_token& operator=(const row_token&) = delete;
    row_token(row_token&&) noexcept = default;
    row_token& operator=(row_token&&) noexcept = default;
    ~row_token() = default;

    // Used by the decoder
    void set(std::size_t index, column_data data);

    std::size_t size() const noexcept { return slots_.size(); }
    slot_state state(std::size_t index) const { return slots_.at(index).state; }
    bool is_null(std::size_t index) const { return state(index) == slot_state::null; }

    // The column data, if the row still owns it. nullptr otherwise
    const column_data* get(std::size_t index) const;

    // Transfers ownership of a column's data to the caller. Returns an empty optional
    // for NULL columns. Taking a column twice, or after release(), is an error
    std::optional<column_data> take(std::size_t index);

    // Number of columns whose data is still owned by the row
    std::size_t owned_count() const noexcept;

    // Releases every column still owned. Transferred columns are left to their owners.
    // Destroying the row has the same effect.
    void release() noexcept;
};

// The size in bytes of the data of a column, length descriptors included
std::size_t wire_size(const column_data& data) noexcept;

// Copies the wire bytes of a column
std::vector<unsigned char> to_wire_bytes(const column_data& data);

// Does the buffer contain an entire ROW token body?
// Never moves the buffer's cursor (it may move and restore it internally).
bool can_decode(receive_buffer& buff, std::span<const column> columns);

// Decodes a ROW token body, moving the cursor past it. can_decode must have returned true
// for the same buffer contents. Otherwise, this throws a boost::system::system_error
// with client_errc::decode_precondition_violated.
row_token decode(receive_buffer& buff, std::span<const column> columns);

// Same as the above, for NBCROW token bodies (a NULL bitmap followed by the values
// of the non-NULL columns)
bool nbc_can_decode(receive_buffer& buff, std::span<const column> columns);
row_token nbc_decode(receive_buffer& buff, std::span<const column> columns);

}  // namespace protocol
}  // namespace nativetds

#endif
