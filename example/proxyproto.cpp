//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// A server that expects a PROXY protocol v2 header at the start of each connection
// and prints the client address it carries. Connect through a proxy that sends v2 headers
// (e.g. HAProxy with send-proxy-v2), or run "proxyproto_example send <port>" to send one.

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

#include "proxyproto/header.hpp"
#include "proxyproto/read.hpp"
#include "proxyproto/write.hpp"

namespace asio = boost::asio;
using asio::ip::tcp;

namespace {

constexpr unsigned short default_port = 8443;

struct address_printer
{
    std::ostream& os;

    void operator()(boost::variant2::monostate) const { os << "<none>"; }
    void operator()(const asio::ip::address_v4& addr) const { os << addr; }
    void operator()(const asio::ip::address_v6& addr) const { os << '[' << addr << ']'; }
    void operator()(const proxyproto::unix_endpoint& ep) const { os << "unix:" << ep.path(); }
};

asio::awaitable<void> handle_connection(tcp::socket sock)
{
    auto peer = sock.remote_endpoint();

    // Read the header. Errors are reported as error codes
    auto [ec, hdr] = co_await proxyproto::async_read_header(sock, asio::as_tuple(asio::use_awaitable));
    if (ec)
    {
        std::cerr << "Connection from " << peer << ": " << ec.message() << std::endl;
        co_return;
    }

    if (hdr.is_local())
    {
        std::cout << "Connection from " << peer << ": LOCAL (health check)" << std::endl;
        co_return;
    }

    std::cout << "Connection from " << peer << ": client ";
    boost::variant2::visit(address_printer{std::cout}, hdr.source_address());
    std::cout << ':' << hdr.source_port() << ", server ";
    boost::variant2::visit(address_printer{std::cout}, hdr.destination_address());
    std::cout << ':' << hdr.destination_port() << std::endl;
}

asio::awaitable<void> listen(unsigned short port)
{
    auto ex = co_await asio::this_coro::executor;
    tcp::acceptor acceptor(ex, tcp::endpoint(tcp::v4(), port));
    std::cout << "Listening on port " << port << std::endl;

    while (true)
    {
        auto sock = co_await acceptor.async_accept(asio::use_awaitable);
        asio::co_spawn(ex, handle_connection(std::move(sock)), asio::detached);
    }
}

asio::awaitable<void> send(unsigned short port)
{
    auto ex = co_await asio::this_coro::executor;
    tcp::socket sock(ex);
    co_await sock.async_connect(tcp::endpoint(asio::ip::address_v4::loopback(), port), asio::use_awaitable);

    // Pretend that we're forwarding a connection from a client in a documentation network
    auto hdr = proxyproto::make_proxy_header(
                   tcp::endpoint(asio::ip::make_address_v4("192.0.2.1"), 443),
                   tcp::endpoint(asio::ip::make_address_v4("198.51.100.1"), 80)
    )
                   .value();

    auto bytes_written = co_await proxyproto::async_write_header(sock, hdr, asio::use_awaitable);
    std::cout << "Sent a " << bytes_written << " byte header" << std::endl;
}

}  // namespace

int main(int argc, char** argv)
{
    std::string_view mode = argc >= 2 ? argv[1] : "listen";
    unsigned short port = argc >= 3 ? static_cast<unsigned short>(std::atoi(argv[2])) : default_port;

    asio::io_context ctx;

    auto coro = mode == "send" ? send(port) : listen(port);
    asio::co_spawn(ctx, std::move(coro), [](std::exception_ptr exc) {
        if (exc)
            std::rethrow_exception(exc);
    });

    ctx.run();
}
