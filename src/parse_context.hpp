//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_SRC_PARSE_CONTEXT_HPP
#define PROXYPROTO_SRC_PARSE_CONTEXT_HPP

#include <boost/assert.hpp>
#include <boost/endian/detail/endian_load.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>

#include "proxyproto/errc.hpp"

namespace proxyproto {
namespace protocol {
namespace detail {

// Sequential reader over an address block. Running out of bytes
// is reported as errc::invalid_address. Once an error has been
// recorded, every further read returns a default value.
class parse_context
{
    const unsigned char* first_;
    const unsigned char* last_;
    boost::system::error_code ec_;

public:
    parse_context(std::span<const unsigned char> range) noexcept
        : first_(range.data()), last_(range.data() + range.size())
    {
    }

    std::size_t size() const { return last_ - first_; }

    void advance(std::size_t by)
    {
        BOOST_ASSERT(by <= size());
        first_ += by;
    }

    template <class IntType>
    IntType get_integral()
    {
        static_assert(std::is_unsigned<IntType>::value, "PROXY protocol only uses unsigned types");
        if (size() < sizeof(IntType))
            add_error(errc::invalid_address);
        if (ec_)
            return {};
        auto res = boost::endian::endian_load<IntType, sizeof(IntType), boost::endian::order::big>(first_);
        advance(sizeof(IntType));
        return res;
    }

    // A fixed-size, NULL-padded string. The returned view stops at the first NULL byte
    std::string_view get_padded_string(std::size_t n)
    {
        if (n > size())
            add_error(errc::invalid_address);
        if (ec_)
            return {};
        auto null_it = std::find(first_, first_ + n, static_cast<unsigned char>(0));
        std::string_view res{reinterpret_cast<const char*>(first_), reinterpret_cast<const char*>(null_it)};
        advance(n);
        return res;
    }

    template <std::size_t N>
    std::array<unsigned char, N> get_byte_array()
    {
        std::array<unsigned char, N> res{};
        if (N > size())
            add_error(errc::invalid_address);
        if (ec_)
            return res;
        std::memcpy(res.data(), first_, N);
        advance(N);
        return res;
    }

    void check_size_and_advance(std::size_t n)
    {
        if (n > size())
            add_error(errc::invalid_address);
        else
            advance(n);
    }

    void add_error(boost::system::error_code ec)
    {
        if (!ec_)
            ec_ = ec;
    }

    boost::system::error_code error() const { return ec_; }
};

}  // namespace detail
}  // namespace protocol
}  // namespace proxyproto

#endif
