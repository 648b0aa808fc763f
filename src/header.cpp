//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/ip/address.hpp>
#include <boost/system/result.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>

#include "proxyproto/errc.hpp"
#include "proxyproto/header.hpp"
#include "proxyproto/protocol/constants.hpp"

using namespace proxyproto;
using boost::variant2::monostate;

namespace {

struct source_address_visitor
{
    network_address operator()(monostate) const { return {}; }
    network_address operator()(const ipv4_addresses& v) const { return v.source; }
    network_address operator()(const ipv6_addresses& v) const { return v.source; }
    network_address operator()(const unix_addresses& v) const { return v.source; }
};

struct destination_address_visitor
{
    network_address operator()(monostate) const { return {}; }
    network_address operator()(const ipv4_addresses& v) const { return v.destination; }
    network_address operator()(const ipv6_addresses& v) const { return v.destination; }
    network_address operator()(const unix_addresses& v) const { return v.destination; }
};

// Scope ids have no representation on the wire
boost::asio::ip::address_v6 without_scope(boost::asio::ip::address_v6 addr)
{
    addr.scope_id(0);
    return addr;
}

template <class Endpoint>
boost::system::result<header> make_ip_header(
    const Endpoint& source,
    const Endpoint& destination,
    transport_protocol v4_proto,
    transport_protocol v6_proto
)
{
    const auto& src = source.address();
    const auto& dst = destination.address();

    if (src.is_v4() && dst.is_v4())
    {
        return header{
            .cmd = command::proxy,
            .proto = v4_proto,
            .addresses = ipv4_addresses{src.to_v4(), dst.to_v4(), source.port(), destination.port()},
        };
    }
    else if (src.is_v6() && dst.is_v6())
    {
        return header{
            .cmd = command::proxy,
            .proto = v6_proto,
            .addresses = ipv6_addresses{
                without_scope(src.to_v6()),
                without_scope(dst.to_v6()),
                source.port(),
                destination.port(),
            },
        };
    }
    return errc::address_family_mismatch;
}

}  // namespace

network_address header::source_address() const
{
    if (is_local())
        return {};
    return boost::variant2::visit(source_address_visitor{}, addresses);
}

network_address header::destination_address() const
{
    if (is_local())
        return {};
    return boost::variant2::visit(destination_address_visitor{}, addresses);
}

std::uint16_t header::source_port() const noexcept
{
    if (is_local())
        return 0u;
    if (const auto* v4 = boost::variant2::get_if<ipv4_addresses>(&addresses))
        return v4->source_port;
    if (const auto* v6 = boost::variant2::get_if<ipv6_addresses>(&addresses))
        return v6->source_port;
    return 0u;
}

std::uint16_t header::destination_port() const noexcept
{
    if (is_local())
        return 0u;
    if (const auto* v4 = boost::variant2::get_if<ipv4_addresses>(&addresses))
        return v4->destination_port;
    if (const auto* v6 = boost::variant2::get_if<ipv6_addresses>(&addresses))
        return v6->destination_port;
    return 0u;
}

namespace proxyproto {

bool operator==(const header& lhs, const header& rhs)
{
    if (lhs.cmd != rhs.cmd)
        return false;

    // Addresses in LOCAL headers are meaningless
    if (lhs.is_local())
        return true;

    return lhs.proto == rhs.proto && lhs.addresses == rhs.addresses;
}

}  // namespace proxyproto

header proxyproto::make_local_header() noexcept { return header{}; }

boost::system::result<header> proxyproto::make_proxy_header(
    const boost::asio::ip::tcp::endpoint& source,
    const boost::asio::ip::tcp::endpoint& destination
)
{
    return make_ip_header(source, destination, transport_protocol::tcp_v4, transport_protocol::tcp_v6);
}

boost::system::result<header> proxyproto::make_proxy_header(
    const boost::asio::ip::udp::endpoint& source,
    const boost::asio::ip::udp::endpoint& destination
)
{
    return make_ip_header(source, destination, transport_protocol::udp_v4, transport_protocol::udp_v6);
}

boost::system::result<header> proxyproto::make_unix_proxy_header(
    transport_protocol proto,
    const unix_endpoint& source,
    const unix_endpoint& destination
)
{
    if (!is_unix(proto) || !protocol::is_supported(proto))
        return errc::address_family_mismatch;
    return header{
        .cmd = command::proxy,
        .proto = proto,
        .addresses = unix_addresses{source, destination},
    };
}
