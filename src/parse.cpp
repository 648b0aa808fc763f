//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>

#include "proxyproto/protocol/constants.hpp"
#include "proxyproto/protocol/parse.hpp"
#include "proxyproto/protocol/read_header_fsm.hpp"

using namespace proxyproto::protocol;
using boost::system::error_code;

boost::system::result<parsed_header> proxyproto::protocol::parse_header(std::span<const unsigned char> data)
{
    read_header_fsm fsm;
    std::size_t bytes_read = 0u;

    while (true)
    {
        auto res = fsm.resume(error_code(), bytes_read);
        if (res.type() == read_header_fsm::result_type::done)
        {
            if (res.error())
                return res.error();
            return parsed_header{fsm.get(), fsm.bytes_consumed()};
        }

        // Copy as much as we have. A short copy makes the FSM fail
        auto buff = res.read_buffer();
        bytes_read = (std::min)(buff.size(), data.size());
        if (bytes_read)
            std::memcpy(buff.data(), data.data(), bytes_read);
        data = data.subspan(bytes_read);
    }
}

signature_match proxyproto::protocol::check_signature(std::span<const unsigned char> data) noexcept
{
    auto n = (std::min)(data.size(), signature.size());
    if (!std::equal(data.begin(), data.begin() + n, signature.begin()))
        return signature_match::mismatch;
    return n == signature.size() ? signature_match::match : signature_match::needs_more;
}
