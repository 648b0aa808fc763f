//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_category.hpp>

#include <string>

#include "proxyproto/errc.hpp"

using namespace proxyproto;

namespace {

static const char* error_to_string(errc error)
{
    switch (error)
    {
        case errc::signature_read: return "The PROXY protocol signature could not be read";
        case errc::signature_mismatch: return "The stream doesn't start with the PROXY protocol v2 signature";
        case errc::command_read: return "The PROXY protocol version and command byte could not be read";
        case errc::unsupported_command: return "Unsupported PROXY protocol version or command";
        case errc::transport_protocol_read:
            return "The PROXY protocol address family and transport byte could not be read";
        case errc::unsupported_transport_protocol:
            return "Unsupported PROXY protocol address family or transport";
        case errc::length_read: return "The PROXY protocol address length could not be read";
        case errc::invalid_length:
            return "The PROXY protocol address length doesn't match the address family";
        case errc::invalid_address: return "The PROXY protocol address block is incomplete";
        case errc::source_unix_address_resolution:
            return "The PROXY protocol source Unix address is not a valid local endpoint";
        case errc::destination_unix_address_resolution:
            return "The PROXY protocol destination Unix address is not a valid local endpoint";
        case errc::address_family_mismatch:
            return "The addresses don't match the PROXY protocol address family";
        default: return "<unknown proxyproto error>";
    }
}

class proxyproto_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "proxyproto"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<errc>(ev)); }
};

static proxyproto_category g_cat;

}  // namespace

const boost::system::error_category& proxyproto::get_category() { return g_cat; }
