//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/ip/address.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "printing.hpp"
#include "proxyproto/errc.hpp"
#include "proxyproto/header.hpp"
#include "proxyproto/protocol/constants.hpp"
#include "proxyproto/protocol/parse.hpp"
#include "proxyproto/protocol/serialize.hpp"
#include "test_utils.hpp"

using namespace proxyproto;
using boost::asio::ip::make_address_v4;
using boost::asio::ip::make_address_v6;
using boost::system::error_code;
using protocol::parse_header;
using protocol::serialize;
using test::concat;

namespace {

header make_ipv4_header()
{
    return header{
        .cmd = command::proxy,
        .proto = transport_protocol::tcp_v4,
        .addresses = ipv4_addresses{make_address_v4("192.0.2.1"), make_address_v4("198.51.100.1"), 443, 80},
    };
}

header make_unix_header(std::string src, std::string dst)
{
    return header{
        .cmd = command::proxy,
        .proto = transport_protocol::unix_stream,
        .addresses = unix_addresses{unix_endpoint(src), unix_endpoint(dst)},
    };
}

// Scenario: encoding a TCP over IPv4 header
void test_ipv4()
{
    std::vector<unsigned char> buff;
    const unsigned char expected_tail[] = {
        0x21, 0x11, 0x00, 0x0c, 0xc0, 0x00, 0x02, 0x01, 0xc6, 0x33, 0x64, 0x01, 0x01, 0xbb, 0x00, 0x50,
    };
    auto expected = concat({protocol::signature, expected_tail});

    auto ec = serialize(make_ipv4_header(), buff);

    BOOST_TEST_EQ(ec, error_code());
    PROXYPROTO_TEST_CONT_EQ(buff, expected)
}

void test_ipv6()
{
    header hdr{
        .cmd = command::proxy,
        .proto = transport_protocol::udp_v6,
        .addresses = ipv6_addresses{make_address_v6("2001:db8::1"), make_address_v6("ff02::fb"), 65535, 0},
    };
    const unsigned char expected_tail[] = {
        0x21, 0x22, 0x00, 0x24, 0x20, 0x01, 0x0d, 0xb8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0xff, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xfb, 0xff, 0xff, 0x00, 0x00,
    };
    auto expected = concat({protocol::signature, expected_tail});
    std::vector<unsigned char> buff;

    auto ec = serialize(hdr, buff);

    BOOST_TEST_EQ(ec, error_code());
    PROXYPROTO_TEST_CONT_EQ(buff, expected)
}

// Paths are NULL-padded to 108 bytes, followed by the 2 reserved bytes
void test_unix()
{
    std::vector<unsigned char> buff;

    auto ec = serialize(make_unix_header("/tmp/src", "/run/dst.sock"), buff);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_EQ(buff.size(), 234u);
    BOOST_TEST_EQ(buff[12], 0x21);
    BOOST_TEST_EQ(buff[13], 0x31);
    BOOST_TEST_EQ(buff[14], 0x00);
    BOOST_TEST_EQ(buff[15], 0xda);

    std::string src(buff.begin() + 16, buff.begin() + 16 + 108);
    std::string dst(buff.begin() + 124, buff.begin() + 124 + 108);
    BOOST_TEST_EQ(src, std::string("/tmp/src") + std::string(100u, '\0'));
    BOOST_TEST_EQ(dst, std::string("/run/dst.sock") + std::string(95u, '\0'));
    BOOST_TEST_EQ(buff[232], 0x00);
    BOOST_TEST_EQ(buff[233], 0x00);
}

// The longest path a local endpoint admits still leaves a NULL terminator
void test_unix_long_path()
{
    std::string path(107u, 'p');
    std::vector<unsigned char> buff;

    auto ec = serialize(make_unix_header(path, "/b"), buff);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_EQ(buff.size(), 234u);
    BOOST_TEST(std::all_of(buff.begin() + 16, buff.begin() + 16 + 107, [](unsigned char c) { return c == 'p'; }));
    BOOST_TEST_EQ(buff[16 + 107], 0x00);
}

// LOCAL: signature, command and transport protocol bytes, nothing else
void test_local()
{
    std::vector<unsigned char> buff;
    const unsigned char expected_tail[] = {0x20, 0x00};
    auto expected = concat({protocol::signature, expected_tail});

    auto ec = serialize(make_local_header(), buff);

    BOOST_TEST_EQ(ec, error_code());
    PROXYPROTO_TEST_CONT_EQ(buff, expected)
}

// Addresses in LOCAL headers are ignored
void test_local_ignores_addresses()
{
    auto hdr = make_ipv4_header();
    hdr.cmd = command::local;
    std::vector<unsigned char> buff;
    const unsigned char expected_tail[] = {0x20, 0x11};
    auto expected = concat({protocol::signature, expected_tail});

    auto ec = serialize(hdr, buff);

    BOOST_TEST_EQ(ec, error_code());
    PROXYPROTO_TEST_CONT_EQ(buff, expected)
}

// Serialization appends to the buffer
void test_non_empty_buffer()
{
    std::vector<unsigned char> buff{0x01, 0x02, 0x03};

    auto ec = serialize(make_ipv4_header(), buff);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_EQ(buff.size(), 31u);
    BOOST_TEST_EQ(buff[0], 0x01);
    BOOST_TEST_EQ(buff[3], 0x0d);
}

// Errors don't leave anything in the buffer
void test_errors()
{
    auto unsupported_cmd = make_ipv4_header();
    unsupported_cmd.cmd = static_cast<command>(0x22);

    auto unsupported_proto = make_ipv4_header();
    unsupported_proto.proto = transport_protocol::unspec;

    auto ipv6_as_ipv4 = make_ipv4_header();
    ipv6_as_ipv4.proto = transport_protocol::tcp_v6;

    auto unix_as_ipv4 = make_unix_header("/a", "/b");
    unix_as_ipv4.proto = transport_protocol::udp_v4;

    auto no_addresses = make_ipv4_header();
    no_addresses.addresses = {};

    struct
    {
        const char* name;
        header hdr;
        error_code expected;
    } cases[] = {
        {"unsupported_cmd",   unsupported_cmd,   errc::unsupported_command           },
        {"unsupported_proto", unsupported_proto, errc::unsupported_transport_protocol},
        {"ipv6_as_ipv4",      ipv6_as_ipv4,      errc::address_family_mismatch       },
        {"unix_as_ipv4",      unix_as_ipv4,      errc::address_family_mismatch       },
        {"no_addresses",      no_addresses,      errc::address_family_mismatch       },
    };

    for (const auto& tc : cases)
    {
        proxyproto::test::context_frame frame(tc.name);
        std::vector<unsigned char> buff{0xaa, 0xbb};
        const unsigned char expected[] = {0xaa, 0xbb};

        auto ec = serialize(tc.hdr, buff);

        PROXYPROTO_TEST_EQ(ec, tc.expected)
        PROXYPROTO_TEST_CONT_EQ(buff, expected)
    }
}

// Serialized IP headers parse back to the same header
void test_roundtrip()
{
    header cases[] = {
        make_ipv4_header(),
        header{
               .cmd = command::proxy,
               .proto = transport_protocol::udp_v4,
               .addresses = ipv4_addresses{make_address_v4("0.0.0.0"), make_address_v4("255.255.255.255"), 0, 65535},
               },
        header{
               .cmd = command::proxy,
               .proto = transport_protocol::tcp_v6,
               .addresses = ipv6_addresses{make_address_v6("::1"), make_address_v6("2001:db8::42"), 50000, 8080},
               },
        make_unix_header("/tmp/src", "/tmp/dst"),
    };

    for (const auto& hdr : cases)
    {
        proxyproto::test::context_frame frame;
        std::vector<unsigned char> buff;

        auto ec = serialize(hdr, buff);
        PROXYPROTO_TEST_EQ(ec, error_code())

        auto res = parse_header(buff);
        PROXYPROTO_TEST(res.has_value())
        PROXYPROTO_TEST_EQ(res->hdr, hdr)
        PROXYPROTO_TEST_EQ(res->size, buff.size())
    }
}

}  // namespace

int main()
{
    test_ipv4();
    test_ipv6();
    test_unix();
    test_unix_long_path();
    test_local();
    test_local_ignores_addresses();
    test_non_empty_buffer();
    test_errors();
    test_roundtrip();

    return boost::report_errors();
}
