//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <vector>

#include "proxyproto/errc.hpp"
#include "proxyproto/header.hpp"
#include "proxyproto/protocol/constants.hpp"
#include "proxyproto/protocol/serialize.hpp"
#include "serialization_context.hpp"

using namespace proxyproto;
using boost::system::error_code;
using protocol::detail::serialization_context;

namespace {

struct address_serializer
{
    serialization_context& ctx;
    transport_protocol proto;

    void operator()(boost::variant2::monostate) const { ctx.add_error(errc::address_family_mismatch); }

    void operator()(const ipv4_addresses& addrs) const
    {
        if (!is_ipv4(proto))
            return ctx.add_error(errc::address_family_mismatch);
        ctx.add_bytes(addrs.source.to_bytes());
        ctx.add_bytes(addrs.destination.to_bytes());
        ctx.add_integral(addrs.source_port);
        ctx.add_integral(addrs.destination_port);
    }

    void operator()(const ipv6_addresses& addrs) const
    {
        if (!is_ipv6(proto))
            return ctx.add_error(errc::address_family_mismatch);
        ctx.add_bytes(addrs.source.to_bytes());
        ctx.add_bytes(addrs.destination.to_bytes());
        ctx.add_integral(addrs.source_port);
        ctx.add_integral(addrs.destination_port);
    }

    void operator()(const unix_addresses& addrs) const
    {
        if (!is_unix(proto))
            return ctx.add_error(errc::address_family_mismatch);
        ctx.add_padded_string(addrs.source.path(), protocol::unix_path_size);
        ctx.add_padded_string(addrs.destination.path(), protocol::unix_path_size);

        // Reserved bytes, up to the declared length
        ctx.add_padded_string({}, protocol::unix_address_size - 2u * protocol::unix_path_size);
    }
};

}  // namespace

error_code proxyproto::protocol::serialize(const header& hdr, std::vector<unsigned char>& to)
{
    serialization_context ctx(to);

    if (!is_supported(hdr.cmd))
        ctx.add_error(errc::unsupported_command);
    else if (!hdr.is_local() && !is_supported(hdr.proto))
        ctx.add_error(errc::unsupported_transport_protocol);
    if (ctx.error())
        return ctx.finalize();

    ctx.add_bytes(signature);
    ctx.add_byte(static_cast<unsigned char>(hdr.cmd));
    ctx.add_byte(static_cast<unsigned char>(hdr.proto));

    // LOCAL headers end here, whatever the addresses hold
    if (hdr.is_local())
        return ctx.finalize();

    ctx.add_integral(static_cast<std::uint16_t>(address_length(hdr.proto)));
    boost::variant2::visit(address_serializer{ctx, hdr.proto}, hdr.addresses);
    return ctx.finalize();
}
