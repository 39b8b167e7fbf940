// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
// UdpTransport over the loopback interface.

#include <catch2/catch.hpp>
#include "transport.hpp"

using namespace ndhc4;

static const Ip4 kLoopback{ 127, 0, 0, 1 };

TEST_CASE("udp transport: loopback") {
    UdpTransport t;
    t.open(kLoopback, 0);
    const auto port = t.local_port();
    REQUIRE(port != 0);

    SECTION("datagram to self") {
        const std::vector<uint8_t> payload{ 1, 2, 3, 4 };
        REQUIRE_FALSE(t.send_to(payload, kLoopback, port));
        Datagram dg;
        const auto ec = t.receive(dg, std::chrono::milliseconds(1000));
        REQUIRE_FALSE(ec);
        CHECK(dg.data == payload);
        CHECK(dg.source == kLoopback);
        CHECK(dg.source_port == port);
    }
    SECTION("deadline") {
        Datagram dg;
        CHECK(t.receive(dg, std::chrono::milliseconds(20)) == boost::asio::error::timed_out);
        CHECK(t.receive(dg, std::chrono::milliseconds(0)) == boost::asio::error::timed_out);
    }
    SECTION("interrupt") {
        t.interrupt();
        Datagram dg;
        CHECK(t.receive(dg, std::chrono::milliseconds(1000))
              == boost::asio::error::operation_aborted);
    }
    t.close();
    t.close();
}
