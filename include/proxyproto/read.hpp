//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_READ_HPP
#define PROXYPROTO_READ_HPP

#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/read.hpp>
#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <cstddef>
#include <memory>
#include <utility>

#include "proxyproto/header.hpp"
#include "proxyproto/protocol/read_header_fsm.hpp"

namespace proxyproto {

namespace detail {

template <class AsyncReadStream>
struct read_header_op
{
    AsyncReadStream& stream;

    // The FSM owns the read buffer, so it can't move with the operation
    std::unique_ptr<protocol::read_header_fsm> fsm;

    template <class Self>
    void operator()(Self& self, boost::system::error_code ec = {}, std::size_t bytes_transferred = {})
    {
        auto res = fsm->resume(ec, bytes_transferred);
        switch (res.type())
        {
            case protocol::read_header_fsm::result_type::read:
            {
                auto buff = res.read_buffer();
                boost::asio::async_read(stream, boost::asio::buffer(buff.data(), buff.size()), std::move(self));
                break;
            }
            case protocol::read_header_fsm::result_type::done:
            {
                header hdr = res.error() ? header{} : fsm->get();
                self.complete(res.error(), std::move(hdr));
                break;
            }
            default: BOOST_ASSERT(false);
        }
    }
};

}  // namespace detail

// Reads a header from the front of the stream, consuming exactly the bytes it occupies.
// Read failures (including EOF) are reported as the read error of the field being read.
// On failure, the stream may have been partially consumed and shouldn't be used to read another header.
template <class SyncReadStream>
boost::system::result<header> read_header(SyncReadStream& stream)
{
    protocol::read_header_fsm fsm;
    boost::system::error_code ec;
    std::size_t bytes_read = 0u;

    while (true)
    {
        auto res = fsm.resume(ec, bytes_read);
        if (res.type() == protocol::read_header_fsm::result_type::done)
        {
            if (res.error())
                return res.error();
            return fsm.get();
        }

        auto buff = res.read_buffer();
        bytes_read = boost::asio::read(stream, boost::asio::buffer(buff.data(), buff.size()), ec);
    }
}

template <
    class AsyncReadStream,
    boost::asio::completion_token_for<void(boost::system::error_code, header)> CompletionToken =
        boost::asio::deferred_t>
auto async_read_header(AsyncReadStream& stream, CompletionToken&& token = {})
{
    return boost::asio::async_compose<CompletionToken, void(boost::system::error_code, header)>(
        detail::read_header_op<AsyncReadStream>{stream, std::make_unique<protocol::read_header_fsm>()},
        token,
        stream
    );
}

}  // namespace proxyproto

#endif
