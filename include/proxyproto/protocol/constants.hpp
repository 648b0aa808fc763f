//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_PROTOCOL_CONSTANTS_HPP
#define PROXYPROTO_PROTOCOL_CONSTANTS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace proxyproto {

// Byte 12: protocol version (high nibble) and command (low nibble)
enum class command : std::uint8_t
{
    local = 0x20,
    proxy = 0x21,
};

// Byte 13: address family (high nibble) and transport (low nibble)
enum class transport_protocol : std::uint8_t
{
    unspec = 0x00,
    tcp_v4 = 0x11,
    udp_v4 = 0x12,
    tcp_v6 = 0x21,
    udp_v6 = 0x22,
    unix_stream = 0x31,
    unix_datagram = 0x32,
};

enum class address_family : std::uint8_t
{
    unspec = 0x0,
    inet = 0x1,
    inet6 = 0x2,
    unix_socket = 0x3,
};

namespace protocol {

inline constexpr std::array<unsigned char, 12> signature{
    0x0d,
    0x0a,
    0x0d,
    0x0a,
    0x00,
    0x0d,
    0x0a,
    0x51,
    0x55,
    0x49,
    0x54,
    0x0a,
};

inline constexpr std::uint8_t version = 2;

// Bytes before the address block: signature, command, transport protocol and length
inline constexpr std::size_t fixed_header_size = signature.size() + 4u;

// Address block sizes
inline constexpr std::size_t ipv4_address_size = 12u;   // 4 + 4 + 2 + 2
inline constexpr std::size_t ipv6_address_size = 36u;   // 16 + 16 + 2 + 2
inline constexpr std::size_t unix_address_size = 218u;  // 108 + 108 + 2 reserved
inline constexpr std::size_t unix_path_size = 108u;

inline constexpr std::size_t max_header_size = fixed_header_size + unix_address_size;

inline constexpr std::array<command, 2> supported_commands{command::local, command::proxy};

inline constexpr std::array<transport_protocol, 6> supported_transport_protocols{
    transport_protocol::tcp_v4,
    transport_protocol::udp_v4,
    transport_protocol::tcp_v6,
    transport_protocol::udp_v6,
    transport_protocol::unix_stream,
    transport_protocol::unix_datagram,
};

constexpr bool is_supported(command cmd) noexcept
{
    for (auto c : supported_commands)
    {
        if (c == cmd)
            return true;
    }
    return false;
}

constexpr bool is_supported(transport_protocol proto) noexcept
{
    for (auto p : supported_transport_protocols)
    {
        if (p == proto)
            return true;
    }
    return false;
}

// The length that the address block must declare for the given protocol.
// Zero if the address family is unspecified or unknown.
constexpr std::size_t address_length(transport_protocol proto) noexcept
{
    switch (static_cast<address_family>(static_cast<std::uint8_t>(proto) >> 4))
    {
        case address_family::inet: return ipv4_address_size;
        case address_family::inet6: return ipv6_address_size;
        case address_family::unix_socket: return unix_address_size;
        default: return 0u;
    }
}

}  // namespace protocol

constexpr bool is_local(command cmd) noexcept { return (static_cast<std::uint8_t>(cmd) & 0x0f) == 0x00; }

constexpr address_family family(transport_protocol proto) noexcept
{
    return static_cast<address_family>(static_cast<std::uint8_t>(proto) >> 4);
}

constexpr bool is_ipv4(transport_protocol proto) noexcept { return family(proto) == address_family::inet; }
constexpr bool is_ipv6(transport_protocol proto) noexcept { return family(proto) == address_family::inet6; }
constexpr bool is_unix(transport_protocol proto) noexcept
{
    return family(proto) == address_family::unix_socket;
}

constexpr bool is_stream(transport_protocol proto) noexcept
{
    return (static_cast<std::uint8_t>(proto) & 0x0f) == 0x01;
}

constexpr bool is_datagram(transport_protocol proto) noexcept
{
    return (static_cast<std::uint8_t>(proto) & 0x0f) == 0x02;
}

}  // namespace proxyproto

#endif
