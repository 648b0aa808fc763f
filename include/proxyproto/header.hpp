//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_HEADER_HPP
#define PROXYPROTO_HEADER_HPP

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/system/result.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>

#include "proxyproto/protocol/constants.hpp"

namespace proxyproto {

// Unix paths are represented as local endpoints, for both stream and datagram sockets
using unix_endpoint = boost::asio::local::stream_protocol::endpoint;

struct ipv4_addresses
{
    boost::asio::ip::address_v4 source;
    boost::asio::ip::address_v4 destination;
    std::uint16_t source_port{};
    std::uint16_t destination_port{};

    friend bool operator==(const ipv4_addresses&, const ipv4_addresses&) = default;
};

// Scope ids are not transmitted. Parsed addresses always have a zero scope id.
struct ipv6_addresses
{
    boost::asio::ip::address_v6 source;
    boost::asio::ip::address_v6 destination;
    std::uint16_t source_port{};
    std::uint16_t destination_port{};

    friend bool operator==(const ipv6_addresses&, const ipv6_addresses&) = default;
};

// Unix sockets carry no ports
struct unix_addresses
{
    unix_endpoint source;
    unix_endpoint destination;

    friend bool operator==(const unix_addresses&, const unix_addresses&) = default;
};

// The address block. The alternative in use must match the transport protocol's family.
// monostate is used for LOCAL headers.
using address_block = boost::variant2::
    variant<boost::variant2::monostate, ipv4_addresses, ipv6_addresses, unix_addresses>;

// A single endpoint address, as exposed by the header accessors
using network_address = boost::variant2::variant<
    boost::variant2::monostate,
    boost::asio::ip::address_v4,
    boost::asio::ip::address_v6,
    unix_endpoint>;

// A PROXY protocol v2 header
struct header
{
    command cmd{command::local};
    transport_protocol proto{transport_protocol::unspec};
    address_block addresses;

    static constexpr std::uint8_t version() noexcept { return proxyproto::protocol::version; }

    bool is_local() const noexcept { return proxyproto::is_local(cmd); }

    // monostate for LOCAL headers
    network_address source_address() const;
    network_address destination_address() const;

    // Zero for LOCAL headers and Unix sockets
    std::uint16_t source_port() const noexcept;
    std::uint16_t destination_port() const noexcept;

    // LOCAL headers compare equal regardless of their addresses
    friend bool operator==(const header& lhs, const header& rhs);
};

header make_local_header() noexcept;

// Picks tcp_v4/tcp_v6 (or udp_v4/udp_v6) from the endpoints. IPv6 scope ids are cleared.
// Fails with errc::address_family_mismatch if the endpoints are of different families.
boost::system::result<header> make_proxy_header(
    const boost::asio::ip::tcp::endpoint& source,
    const boost::asio::ip::tcp::endpoint& destination
);
boost::system::result<header> make_proxy_header(
    const boost::asio::ip::udp::endpoint& source,
    const boost::asio::ip::udp::endpoint& destination
);

// proto must be unix_stream or unix_datagram
boost::system::result<header> make_unix_proxy_header(
    transport_protocol proto,
    const unix_endpoint& source,
    const unix_endpoint& destination
);

}  // namespace proxyproto

#endif
