// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT

#include <stdexcept>
#include <catch2/catch.hpp>
#include "options.hpp"

using namespace ndhc4;

static std::optional<Option> decode_encoded(const std::vector<uint8_t> &b)
{
    REQUIRE(b.size() >= 2);
    REQUIRE(b[1] == b.size() - 2);
    return decode_option(b[0], b.data() + 2, b[1]);
}

TEST_CASE("options: wire layout") {
    SECTION("message type") {
        CHECK(encode_option(make_message_type(MessageType::Discover))
              == std::vector<uint8_t>{ 53, 1, 1 });
    }
    SECTION("client identifier") {
        CHECK(encode_option(make_client_id(MacAddr{ 0, 0, 0, 0, 0, 1 }))
              == std::vector<uint8_t>{ 61, 7, 1, 0, 0, 0, 0, 0, 1 });
    }
    SECTION("parameter request list") {
        std::vector<uint8_t> want{ 55, static_cast<uint8_t>(default_parameter_list.size()) };
        want.insert(want.end(), default_parameter_list.begin(), default_parameter_list.end());
        CHECK(encode_option(make_parameter_list()) == want);
    }
    SECTION("lease time and max message size") {
        CHECK(encode_option(make_lease_time(7776000))
              == std::vector<uint8_t>{ 51, 4, 0x00, 0x76, 0xa7, 0x00 });
        CHECK(encode_option(make_max_message_size(1500))
              == std::vector<uint8_t>{ 57, 2, 0x05, 0xdc });
    }
    SECTION("end has no length byte") {
        CHECK(encode_option(make_end()) == std::vector<uint8_t>{ 255 });
    }
}

TEST_CASE("options: decode what was encoded") {
    const std::vector<Option> opts{
        SubnetMaskOption{ { 255, 255, 255, 0 } },
        RouterOption{ { Ip4{ 10, 0, 0, 1 }, Ip4{ 10, 0, 0, 2 } } },
        DnsServerOption{ { Ip4{ 8, 8, 8, 8 } } },
        HostNameOption{ "client" },
        RequestedIpOption{ Ip4{ 10, 0, 0, 5 } },
        ServerIdOption{ Ip4{ 10, 0, 0, 1 } },
        RenewalTimeOption{ 1800 },
        RebindingTimeOption{ 3150 },
        Ipv6OnlyPreferredOption{ { 0, 0, 0x07, 0x08 } },
    };
    for (const auto &o: opts) {
        INFO(render_option(o));
        auto d = decode_encoded(encode_option(o));
        REQUIRE(d);
        CHECK(*d == o);
        CHECK(option_code(*d) == option_code(o));
    }
    CHECK(std::get<Ipv6OnlyPreferredOption>(opts.back()).seconds() == 0x0708);
}

TEST_CASE("options: bad payload lengths") {
    const uint8_t p[] = { 1, 2, 3, 4, 5, 6, 7, 8 };
    CHECK_FALSE(decode_option(50, p, 3));
    CHECK_FALSE(decode_option(51, p, 5));
    CHECK_FALSE(decode_option(53, p, 2));
    CHECK_FALSE(decode_option(53, p, 0));
    CHECK_FALSE(decode_option(54, p, 8));
    CHECK_FALSE(decode_option(57, p, 1));
    CHECK_FALSE(decode_option(58, p, 2));
    CHECK_FALSE(decode_option(59, p, 6));
    CHECK_FALSE(decode_option(3, p, 6));
    CHECK_FALSE(decode_option(6, p, 7));
    CHECK_FALSE(decode_option(61, p, 0));
    CHECK_FALSE(decode_option(42, p, 4));

    auto empty_routers = decode_option(3, p, 0);
    REQUIRE(empty_routers);
    CHECK(std::get<RouterOption>(*empty_routers).routers.empty());
}

TEST_CASE("options: oversized payload") {
    CHECK_THROWS_AS(encode_option(make_host_name(std::string(256, 'a'))),
                    std::length_error);
    CHECK(encode_option(make_host_name(std::string(255, 'a'))).size() == 257);
}

TEST_CASE("options: rendering") {
    CHECK(render_option(make_message_type(MessageType::Discover))
          == "Option:(53) Length:1 DHCP:DISCOVER");
    CHECK(render_option(ServerIdOption{ Ip4{ 10, 0, 0, 1 } })
          == "Option:(54) Length:4 Server Identifier:10.0.0.1");
    CHECK(render_option(make_client_id(MacAddr{ 0, 0, 0, 0, 0, 1 }))
          == "Option:(61) Length:7 Hardware Type:1 Client Identifier:00:00:00:00:00:01");
    CHECK(render_option(make_end()) == "Option:(255) End");
    CHECK(std::string(message_type_name(static_cast<MessageType>(9))) == "UNKNOWN");
}
