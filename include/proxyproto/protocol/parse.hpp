//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_PROTOCOL_PARSE_HPP
#define PROXYPROTO_PROTOCOL_PARSE_HPP

#include <boost/system/result.hpp>

#include <cstddef>
#include <span>

#include "proxyproto/header.hpp"

namespace proxyproto::protocol {

struct parsed_header
{
    header hdr;

    // Number of bytes the header occupies at the front of the buffer
    std::size_t size;
};

// Parses a header from the front of an in-memory buffer. Bytes past the header are ignored.
// A truncated buffer fails with the read error of the field where the data ended.
boost::system::result<parsed_header> parse_header(std::span<const unsigned char> data);

enum class signature_match
{
    match,
    mismatch,
    needs_more,
};

// Checks whether a buffer, possibly holding only the first few bytes of a connection,
// starts with the v2 signature
signature_match check_signature(std::span<const unsigned char> data) noexcept;

}  // namespace proxyproto::protocol

#endif
