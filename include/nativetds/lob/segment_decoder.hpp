//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_LOB_SEGMENT_DECODER_HPP
#define NATIVETDS_LOB_SEGMENT_DECODER_HPP

// Decoders turn the payload of each chunk of a large object into a segment.
// They are fed chunks in order, and may keep state between them: a character
// split across two chunks is emitted with the segment of the second one.
//
// Requirements on a decoder type D:
//   D::segment_type              the type of the emitted segments
//   D(const protocol::type_info&)
//   error_code d.decode(std::span<const unsigned char> chunk, D::segment_type& out)
//       appends the decoded contents of chunk to out
//   error_code d.finish()
//       called once after the last chunk. Fails if state is left over

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "nativetds/protocol/type_info.hpp"

namespace nativetds {
namespace lob {

// Decodes text in the column's charset into UTF-8
class text_decoder
{
    protocol::charset cs_;
    unsigned char pending_[4]{};  // bytes of an incomplete character carried to the next chunk
    std::size_t num_pending_{};
    char16_t high_surrogate_{};   // UTF-16 only: a high surrogate waiting for its pair

    boost::system::error_code decode_single_byte(std::span<const unsigned char> chunk, std::string& out) const;
    boost::system::error_code decode_utf8(std::span<const unsigned char> chunk, std::string& out);
    boost::system::error_code decode_utf16le(std::span<const unsigned char> chunk, std::string& out);

public:
    using segment_type = std::string;

    explicit text_decoder(protocol::charset cs) noexcept : cs_(cs) {}
    explicit text_decoder(const protocol::type_info& type) noexcept : text_decoder(type.cs) {}

    protocol::charset charset() const noexcept { return cs_; }

    [[nodiscard]] boost::system::error_code decode(std::span<const unsigned char> chunk, std::string& out);
    [[nodiscard]] boost::system::error_code finish() const;
};

// Binary values are passed through
class binary_decoder
{
public:
    using segment_type = std::vector<unsigned char>;

    binary_decoder() = default;
    explicit binary_decoder(const protocol::type_info&) noexcept {}

    [[nodiscard]] boost::system::error_code decode(
        std::span<const unsigned char> chunk,
        std::vector<unsigned char>& out
    )
    {
        out.insert(out.end(), chunk.begin(), chunk.end());
        return {};
    }

    [[nodiscard]] boost::system::error_code finish() const { return {}; }
};

namespace detail {

// Appends the UTF-8 encoding of a Unicode code point
void append_utf8(char32_t cp, std::string& to);

}  // namespace detail

}  // namespace lob
}  // namespace nativetds

#endif
