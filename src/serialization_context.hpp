//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_SRC_SERIALIZATION_CONTEXT_HPP
#define PROXYPROTO_SRC_SERIALIZATION_CONTEXT_HPP

#include <boost/endian/detail/endian_store.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace proxyproto {
namespace protocol {
namespace detail {

class serialization_context
{
    std::vector<unsigned char>& buffer_;
    std::size_t initial_size_;
    boost::system::error_code err_;

public:
    serialization_context(std::vector<unsigned char>& buff) noexcept
        : buffer_(buff), initial_size_(buff.size())
    {
    }

    void add_error(boost::system::error_code ec)
    {
        if (!err_)
            err_ = ec;
    }

    boost::system::error_code error() const { return err_; }

    template <class IntType>
    void add_integral(IntType value)
    {
        unsigned char buff[sizeof(IntType)];
        boost::endian::endian_store<IntType, sizeof(IntType), boost::endian::order::big>(buff, value);
        add_bytes(buff);
    }

    // Writes exactly n bytes: s is truncated if longer, and NULL-padded if shorter
    void add_padded_string(std::string_view s, std::size_t n)
    {
        auto len = (std::min)(s.size(), n);
        add_bytes({reinterpret_cast<const unsigned char*>(s.data()), len});
        buffer_.insert(buffer_.end(), n - len, static_cast<unsigned char>(0));
    }

    void add_bytes(std::span<const unsigned char> contents)
    {
        buffer_.insert(buffer_.end(), contents.begin(), contents.end());
    }

    void add_byte(unsigned char byte) { buffer_.push_back(byte); }

    // Returns the recorded error, if any. On error, the buffer is restored to its original size,
    // so that a failed serialization never leaves a partial header behind
    boost::system::error_code finalize()
    {
        if (err_)
            buffer_.resize(initial_size_);
        return err_;
    }
};

}  // namespace detail
}  // namespace protocol
}  // namespace proxyproto

#endif
