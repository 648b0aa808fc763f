//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_PROTOCOL_READ_HEADER_FSM_HPP
#define PROXYPROTO_PROTOCOL_READ_HEADER_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <span>

#include "proxyproto/header.hpp"
#include "proxyproto/protocol/constants.hpp"

namespace proxyproto::protocol {

// A finite-state machine to read a header from a stream.
// resume() returns a variant-like type specifying what to do next.
// Flow should be:
//   - Create a new FSM per header. The FSM owns the buffer the header is read into,
//     so it must not be moved while a read is outstanding.
//   - Call resume(). The first call ignores its arguments.
//   - If resume() returns read, read exactly result::read_buffer().size() bytes into
//     the returned buffer, then call resume() passing the I/O error and the bytes read.
//     Reading less than requested is reported as the read error of the field being read.
//   - If resume() returns done, check result::error(). On success, the header is available
//     through get(). Don't call resume() again.
// Bytes are never requested past the end of the header, so the stream is left positioned
// right after it. LOCAL headers end after the command byte.
class read_header_fsm
{
public:
    enum class result_type
    {
        done,
        read,
    };

    class result
    {
        result_type type_;
        union
        {
            boost::system::error_code ec_;
            std::span<unsigned char> data_;
        };

        result(std::span<unsigned char> data) noexcept : type_(result_type::read), data_(data) {}

    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::done), ec_(ec) {}

        static result read(std::span<unsigned char> buff) { return result(buff); }

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::done);
            return ec_;
        }

        std::span<unsigned char> read_buffer() const
        {
            BOOST_ASSERT(type_ == result_type::read);
            return data_;
        }
    };

    read_header_fsm() = default;

    result resume(boost::system::error_code io_error, std::size_t bytes_read);

    const header& get() const { return hdr_; }

    // Total number of header bytes read so far
    std::size_t bytes_consumed() const { return size_; }

private:
    int resume_point_{0};
    std::size_t size_{};
    std::size_t requested_{};
    std::size_t address_length_{};
    std::array<unsigned char, max_header_size> buffer_{};
    header hdr_;

    result request(std::size_t n);
    bool commit(boost::system::error_code io_error, std::size_t bytes_read);
};

}  // namespace proxyproto::protocol

#endif
