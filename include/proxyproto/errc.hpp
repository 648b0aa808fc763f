//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_ERRC_HPP
#define PROXYPROTO_ERRC_HPP

#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>

namespace proxyproto {

const boost::system::error_category& get_category();

enum class errc : int
{
    /// The stream ended (or failed) before the 12 signature bytes could be read.
    signature_read = 1,

    /// The first 12 bytes are not the PROXY protocol v2 signature.
    signature_mismatch,

    /// The stream ended (or failed) before the version/command byte could be read.
    command_read,

    /// The version/command byte is not one of the supported values.
    unsupported_command,

    /// The stream ended (or failed) before the address family/transport byte could be read.
    transport_protocol_read,

    /// The address family/transport byte is not one of the supported values.
    unsupported_transport_protocol,

    /// The stream ended (or failed) before the 2-byte length field could be read.
    length_read,

    /// The declared length doesn't match the one mandated by the address family.
    invalid_length,

    /// The address block couldn't be read completely.
    invalid_address,

    // The source Unix path can't be represented as a local endpoint
    source_unix_address_resolution,

    // The destination Unix path can't be represented as a local endpoint
    destination_unix_address_resolution,

    // The addresses in a header don't match the family of its transport protocol,
    // or a source/destination pair mixes address families
    address_family_mismatch,
};

/// Creates an \ref error_code from a \ref errc.
inline boost::system::error_code make_error_code(errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_category());
}

}  // namespace proxyproto

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::proxyproto::errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
