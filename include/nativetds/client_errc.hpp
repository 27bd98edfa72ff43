//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_CLIENT_ERRC_HPP
#define NATIVETDS_CLIENT_ERRC_HPP

#include <boost/system/error_code.hpp>

namespace nativetds {

const boost::system::error_category& get_client_category();

enum class client_errc : int
{
    /// An incomplete message was received from the server (indicates a deserialization error or
    /// packet mismatch).
    incomplete_message = 1,

    /// An unexpected value was found in a server-received message (indicates a deserialization
    /// error or packet mismatch).
    protocol_value_error,

    /// Unexpected extra bytes at the end of a message were received (indicates a deserialization
    /// error or packet mismatch).
    extra_bytes,

    // A PLP chunk header announced more bytes than the value contains
    plp_chunk_truncated,

    // A PLP value ended before its zero-length terminator chunk
    plp_missing_terminator,

    // A text value ended in the middle of a character
    incomplete_character,

    // A text value contains a byte sequence that is not valid in its charset
    invalid_character,

    // We got a token type that can't appear where we are. This is a protocol violation.
    unexpected_token,

    // decode() ran out of bytes. This means that can_decode() wasn't called or returned false.
    // This is a user error.
    decode_precondition_violated,

    // The consumer cancelled a large object stream
    stream_cancelled,

    // A configuration string contains a value we can't use
    invalid_config_value,
};

/// Creates an \ref error_code from a \ref client_errc.
inline boost::system::error_code make_error_code(client_errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_client_category());
}

}  // namespace nativetds

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::nativetds::client_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
