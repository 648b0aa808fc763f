//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_WRITE_HPP
#define PROXYPROTO_WRITE_HPP

#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <cstddef>
#include <utility>
#include <vector>

#include "proxyproto/header.hpp"
#include "proxyproto/protocol/serialize.hpp"

namespace proxyproto {

namespace detail {

template <class AsyncWriteStream>
struct write_header_op
{
    AsyncWriteStream& stream;
    std::vector<unsigned char> buffer;
    boost::system::error_code serialize_error;
    int resume_point{0};

    template <class Self>
    void operator()(Self& self, boost::system::error_code ec = {}, std::size_t bytes_transferred = {})
    {
        switch (resume_point)
        {
            case 0:
                resume_point = 1;
                // Don't complete inline from the initiating function
                if (serialize_error)
                    boost::asio::post(std::move(self));
                else
                    boost::asio::async_write(stream, boost::asio::buffer(buffer), std::move(self));
                break;
            case 1:
                if (serialize_error)
                    self.complete(serialize_error, std::size_t(0));
                else
                    self.complete(ec, bytes_transferred);
                break;
        }
    }
};

}  // namespace detail

// Serializes the header and writes it with a single write operation.
// Serialization errors are detected before any byte is written.
// Returns the number of bytes written.
// LOCAL headers are written as 14 bytes, including the transport protocol byte,
// while read_header consumes only 13. A peer reading with read_header sees that
// extra byte as the first byte of the data that follows.
template <class SyncWriteStream>
boost::system::result<std::size_t> write_header(SyncWriteStream& stream, const header& hdr)
{
    std::vector<unsigned char> buff;
    if (auto ec = protocol::serialize(hdr, buff))
        return ec;

    boost::system::error_code ec;
    std::size_t bytes_written = boost::asio::write(stream, boost::asio::buffer(buff), ec);
    if (ec)
        return ec;
    return bytes_written;
}

// Async version of write_header, with the same wire output. LOCAL headers are 14 bytes long.
// Completes with the number of bytes written.
template <
    class AsyncWriteStream,
    boost::asio::completion_token_for<void(boost::system::error_code, std::size_t)> CompletionToken =
        boost::asio::deferred_t>
auto async_write_header(AsyncWriteStream& stream, const header& hdr, CompletionToken&& token = {})
{
    // Serialize upfront, so the header doesn't need to outlive the operation
    std::vector<unsigned char> buff;
    auto ec = protocol::serialize(hdr, buff);

    return boost::asio::async_compose<CompletionToken, void(boost::system::error_code, std::size_t)>(
        detail::write_header_op<AsyncWriteStream>{stream, std::move(buff), ec},
        token,
        stream
    );
}

}  // namespace proxyproto

#endif
