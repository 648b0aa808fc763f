//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <set>
#include <string>
#include <string_view>

#include "proxyproto/errc.hpp"
#include "test_utils.hpp"

using boost::system::error_code;
using proxyproto::errc;

namespace {

constexpr errc all_errors[] = {
    errc::signature_read,
    errc::signature_mismatch,
    errc::command_read,
    errc::unsupported_command,
    errc::transport_protocol_read,
    errc::unsupported_transport_protocol,
    errc::length_read,
    errc::invalid_length,
    errc::invalid_address,
    errc::source_unix_address_resolution,
    errc::destination_unix_address_resolution,
    errc::address_family_mismatch,
};

void test_category()
{
    error_code ec = errc::invalid_length;
    BOOST_TEST(ec.failed());
    BOOST_TEST(ec.category() == proxyproto::get_category());
    BOOST_TEST_EQ(std::string_view(ec.category().name()), "proxyproto");
    BOOST_TEST_EQ(ec.value(), static_cast<int>(errc::invalid_length));
}

// Every error has its own message
void test_messages()
{
    std::set<std::string> messages;
    for (auto e : all_errors)
    {
        proxyproto::test::context_frame frame(std::to_string(static_cast<int>(e)));
        auto msg = error_code(e).message();
        PROXYPROTO_TEST(msg.find("unknown") == std::string::npos)
        PROXYPROTO_TEST(messages.insert(msg).second)
    }
}

void test_unknown_message()
{
    error_code ec(0xffff, proxyproto::get_category());
    BOOST_TEST_EQ(ec.message(), "<unknown proxyproto error>");
}

// Errors are programmatically distinguishable
void test_comparison()
{
    BOOST_TEST(error_code(errc::signature_read) == errc::signature_read);
    BOOST_TEST(error_code(errc::signature_read) != errc::signature_mismatch);
    BOOST_TEST(error_code(errc::source_unix_address_resolution) != errc::destination_unix_address_resolution);
}

}  // namespace

int main()
{
    test_category();
    test_messages();
    test_unknown_message();
    test_comparison();

    return boost::report_errors();
}
