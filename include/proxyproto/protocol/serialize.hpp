//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_PROTOCOL_SERIALIZE_HPP
#define PROXYPROTO_PROTOCOL_SERIALIZE_HPP

#include <boost/system/error_code.hpp>

#include <vector>

#include "proxyproto/header.hpp"

namespace proxyproto::protocol {

// Appends the wire representation of the header to the buffer.
// LOCAL headers emit the signature, the command byte and the transport protocol byte only.
// On error, the buffer is left untouched.
[[nodiscard]] boost::system::error_code serialize(const header& hdr, std::vector<unsigned char>& to);

}  // namespace proxyproto::protocol

#endif
