//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <string>

#include "nativetds/client_errc.hpp"

using namespace nativetds;

namespace {

static const char* error_to_string(client_errc error)
{
    switch (error)
    {
        case client_errc::incomplete_message: return "An incomplete message was received from the server";
        case client_errc::extra_bytes: return "Unexpected extra bytes at the end of a message were received";
        case client_errc::protocol_value_error:
            return "An unexpected value was found in a server-received message";
        case client_errc::plp_chunk_truncated:
            return "A PLP chunk is shorter than the length declared in its header";
        case client_errc::plp_missing_terminator:
            return "A PLP value ended before its terminator chunk was found";
        case client_errc::incomplete_character: return "A text value ended in the middle of a character";
        case client_errc::invalid_character:
            return "A text value contains a byte sequence that is invalid in its character set";
        case client_errc::unexpected_token: return "A token that can't appear at this point was received";
        case client_errc::decode_precondition_violated:
            return "decode() ran out of bytes. Call can_decode() first and only decode if it returned true";
        case client_errc::stream_cancelled: return "The large object stream was cancelled";
        case client_errc::invalid_config_value: return "A configuration string contains an invalid value";
        default: return "<unknown nativetds client error>";
    }
}

class client_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "nativetds.client"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<client_errc>(ev)); }
};

static client_category g_clicat;

}  // namespace

const boost::system::error_category& nativetds::get_client_category() { return g_clicat; }
