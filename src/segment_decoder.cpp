//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "nativetds/client_errc.hpp"
#include "nativetds/lob/segment_decoder.hpp"
#include "nativetds/protocol/type_info.hpp"

using namespace nativetds;
using namespace nativetds::lob;
using boost::system::error_code;
using protocol::charset;

namespace {

// windows-1252 differs from ISO-8859-1 in 0x80-0x9F. Unassigned positions
// map to the C1 control with the same value.
constexpr char16_t windows_1252_high[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, 0x02C6, 0x2030, 0x0160,
    0x2039, 0x0152, 0x008D, 0x017D, 0x008F, 0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022,
    0x2013, 0x2014, 0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
};

bool is_high_surrogate(char16_t c) { return c >= 0xD800u && c <= 0xDBFFu; }
bool is_low_surrogate(char16_t c) { return c >= 0xDC00u && c <= 0xDFFFu; }

// Length of a UTF-8 sequence given its lead byte. 0 if the byte can't start a sequence
std::size_t utf8_sequence_length(unsigned char lead)
{
    if (lead < 0x80u)
        return 1u;
    if (lead >= 0xC2u && lead <= 0xDFu)
        return 2u;
    if (lead >= 0xE0u && lead <= 0xEFu)
        return 3u;
    if (lead >= 0xF0u && lead <= 0xF4u)
        return 4u;
    return 0u;
}

// Is byte an acceptable byte at position pos (>= 1) of a sequence starting with lead?
// Rejects overlong forms, surrogates and code points past U+10FFFF
bool utf8_valid_continuation(unsigned char lead, std::size_t pos, unsigned char byte)
{
    if (byte < 0x80u || byte > 0xBFu)
        return false;
    if (pos != 1u)
        return true;
    switch (lead)
    {
        case 0xE0u: return byte >= 0xA0u;
        case 0xEDu: return byte <= 0x9Fu;
        case 0xF0u: return byte >= 0x90u;
        case 0xF4u: return byte <= 0x8Fu;
        default: return true;
    }
}

}  // namespace

void nativetds::lob::detail::append_utf8(char32_t cp, std::string& to)
{
    BOOST_ASSERT(cp <= 0x10FFFFu);
    if (cp < 0x80u)
    {
        to.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800u)
    {
        to.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        to.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp < 0x10000u)
    {
        to.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        to.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        to.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
        to.push_back(static_cast<char>(0xF0u | (cp >> 18)));
        to.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
        to.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        to.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
}

error_code text_decoder::decode_single_byte(std::span<const unsigned char> chunk, std::string& out) const
{
    out.reserve(out.size() + chunk.size());
    for (unsigned char b : chunk)
    {
        if (b < 0x80u)
        {
            out.push_back(static_cast<char>(b));
            continue;
        }

        switch (cs_)
        {
            case charset::us_ascii: return client_errc::invalid_character;
            case charset::iso_8859_1: lob::detail::append_utf8(b, out); break;
            case charset::windows_1252:
                lob::detail::append_utf8(b < 0xA0u ? windows_1252_high[b - 0x80u] : char16_t(b), out);
                break;
            default: BOOST_ASSERT(false);
        }
    }
    return {};
}

error_code text_decoder::decode_utf8(std::span<const unsigned char> chunk, std::string& out)
{
    out.reserve(out.size() + chunk.size());
    for (unsigned char b : chunk)
    {
        if (num_pending_ == 0u)
        {
            auto len = utf8_sequence_length(b);
            if (len == 0u)
                return client_errc::invalid_character;
            if (len == 1u)
            {
                out.push_back(static_cast<char>(b));
                continue;
            }
            pending_[num_pending_++] = b;
            continue;
        }

        if (!utf8_valid_continuation(pending_[0], num_pending_, b))
            return client_errc::invalid_character;
        pending_[num_pending_++] = b;

        // The input is already UTF-8, so a complete sequence is copied as is
        if (num_pending_ == utf8_sequence_length(pending_[0]))
        {
            out.append(reinterpret_cast<const char*>(pending_), num_pending_);
            num_pending_ = 0u;
        }
    }
    return {};
}

error_code text_decoder::decode_utf16le(std::span<const unsigned char> chunk, std::string& out)
{
    out.reserve(out.size() + chunk.size() / 2u);
    for (unsigned char b : chunk)
    {
        // Chunk boundaries may fall in the middle of a code unit
        if (num_pending_ == 0u)
        {
            pending_[0] = b;
            num_pending_ = 1u;
            continue;
        }
        auto unit = static_cast<char16_t>(pending_[0] | (b << 8));
        num_pending_ = 0u;

        if (high_surrogate_)
        {
            if (!is_low_surrogate(unit))
                return client_errc::invalid_character;
            char32_t cp = 0x10000u + ((high_surrogate_ - 0xD800u) << 10) + (unit - 0xDC00u);
            high_surrogate_ = 0u;
            lob::detail::append_utf8(cp, out);
        }
        else if (is_high_surrogate(unit))
        {
            high_surrogate_ = unit;
        }
        else if (is_low_surrogate(unit))
        {
            return client_errc::invalid_character;
        }
        else
        {
            lob::detail::append_utf8(unit, out);
        }
    }
    return {};
}

error_code text_decoder::decode(std::span<const unsigned char> chunk, std::string& out)
{
    switch (cs_)
    {
        case charset::utf8: return decode_utf8(chunk, out);
        case charset::utf16le: return decode_utf16le(chunk, out);
        default: return decode_single_byte(chunk, out);
    }
}

error_code text_decoder::finish() const
{
    if (num_pending_ != 0u || high_surrogate_ != 0u)
        return client_errc::incomplete_character;
    return {};
}
