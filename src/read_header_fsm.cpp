//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "coroutine.hpp"
#include "parse_context.hpp"
#include "proxyproto/errc.hpp"
#include "proxyproto/header.hpp"
#include "proxyproto/protocol/constants.hpp"
#include "proxyproto/protocol/read_header_fsm.hpp"

using namespace proxyproto::protocol;
using boost::system::error_code;
using proxyproto::errc;
using proxyproto::header;

namespace {

constexpr std::size_t command_offset = signature.size();
constexpr std::size_t transport_protocol_offset = command_offset + 1u;
constexpr std::size_t length_offset = transport_protocol_offset + 1u;

std::string_view trim(std::string_view s)
{
    constexpr std::string_view whitespace = " \t\r\n\v\f";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return {};
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1u);
}

std::optional<proxyproto::unix_endpoint> to_unix_endpoint(std::string_view path)
{
    // Asio throws if the path doesn't fit in a sockaddr_un
    try
    {
        return proxyproto::unix_endpoint(std::string(path));
    }
    catch (const boost::system::system_error&)
    {
        return std::nullopt;
    }
}

error_code decode_ipv4(detail::parse_context& ctx, header& to)
{
    proxyproto::ipv4_addresses addrs;
    addrs.source = boost::asio::ip::address_v4(ctx.get_byte_array<4>());
    addrs.destination = boost::asio::ip::address_v4(ctx.get_byte_array<4>());
    addrs.source_port = ctx.get_integral<std::uint16_t>();
    addrs.destination_port = ctx.get_integral<std::uint16_t>();
    if (ctx.error())
        return ctx.error();
    to.addresses = addrs;
    return {};
}

error_code decode_ipv6(detail::parse_context& ctx, header& to)
{
    proxyproto::ipv6_addresses addrs;
    addrs.source = boost::asio::ip::address_v6(ctx.get_byte_array<16>());
    addrs.destination = boost::asio::ip::address_v6(ctx.get_byte_array<16>());
    addrs.source_port = ctx.get_integral<std::uint16_t>();
    addrs.destination_port = ctx.get_integral<std::uint16_t>();
    if (ctx.error())
        return ctx.error();
    to.addresses = addrs;
    return {};
}

error_code decode_unix(detail::parse_context& ctx, header& to)
{
    auto src = trim(ctx.get_padded_string(unix_path_size));
    auto dst = trim(ctx.get_padded_string(unix_path_size));
    ctx.check_size_and_advance(unix_address_size - 2u * unix_path_size);  // reserved
    if (ctx.error())
        return ctx.error();

    auto src_ep = to_unix_endpoint(src);
    if (!src_ep)
        return errc::source_unix_address_resolution;
    auto dst_ep = to_unix_endpoint(dst);
    if (!dst_ep)
        return errc::destination_unix_address_resolution;

    to.addresses = proxyproto::unix_addresses{std::move(*src_ep), std::move(*dst_ep)};
    return {};
}

// Decodes the address block, once its length has been validated
error_code decode_addresses(std::span<const unsigned char> data, header& to)
{
    detail::parse_context ctx(data);
    if (is_ipv4(to.proto))
        return decode_ipv4(ctx, to);
    else if (is_ipv6(to.proto))
        return decode_ipv6(ctx, to);
    BOOST_ASSERT(is_unix(to.proto));
    return decode_unix(ctx, to);
}

}  // namespace

read_header_fsm::result read_header_fsm::request(std::size_t n)
{
    BOOST_ASSERT(size_ + n <= buffer_.size());
    requested_ = n;
    return result::read(std::span<unsigned char>(buffer_).subspan(size_, n));
}

bool read_header_fsm::commit(error_code io_error, std::size_t bytes_read)
{
    if (io_error || bytes_read != requested_)
        return false;
    size_ += bytes_read;
    return true;
}

read_header_fsm::result read_header_fsm::resume(error_code io_error, std::size_t bytes_read)
{
    switch (resume_point_)
    {
        PROXYPROTO_CORO_INITIAL

        // Signature
        PROXYPROTO_YIELD(resume_point_, 1, request(signature.size()))
        if (!commit(io_error, bytes_read))
            return error_code(errc::signature_read);
        if (!std::equal(signature.begin(), signature.end(), buffer_.begin()))
            return error_code(errc::signature_mismatch);

        // Version and command
        PROXYPROTO_YIELD(resume_point_, 2, request(1u))
        if (!commit(io_error, bytes_read))
            return error_code(errc::command_read);
        hdr_.cmd = static_cast<command>(buffer_[command_offset]);
        if (!is_supported(hdr_.cmd))
            return error_code(errc::unsupported_command);

        // LOCAL headers end here
        if (hdr_.is_local())
            return error_code();

        // Address family and transport
        PROXYPROTO_YIELD(resume_point_, 3, request(1u))
        if (!commit(io_error, bytes_read))
            return error_code(errc::transport_protocol_read);
        hdr_.proto = static_cast<transport_protocol>(buffer_[transport_protocol_offset]);
        if (!is_supported(hdr_.proto))
            return error_code(errc::unsupported_transport_protocol);

        // Length. Validated before reading any address byte
        PROXYPROTO_YIELD(resume_point_, 4, request(2u))
        if (!commit(io_error, bytes_read))
            return error_code(errc::length_read);
        address_length_ = boost::endian::load_big_u16(buffer_.data() + length_offset);
        if (address_length_ != address_length(hdr_.proto))
            return error_code(errc::invalid_length);

        // Address block
        PROXYPROTO_YIELD(resume_point_, 5, request(address_length_))
        if (!commit(io_error, bytes_read))
            return error_code(errc::invalid_address);
        return decode_addresses(
            std::span<const unsigned char>(buffer_).subspan(fixed_header_size, address_length_),
            hdr_
        );
    }

    // resume() called after done
    BOOST_ASSERT(false);
    return error_code();
}
