// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT

#include <catch2/catch.hpp>
#include "ipaddr.hpp"
#include "macstr.hpp"
#include "rng.hpp"

using namespace ndhc4;

TEST_CASE("macstr") {
    SECTION("colon and dash separators") {
        auto a = macstr_to_raw("00:1a:2B:3c:4d:ff");
        auto b = macstr_to_raw("00-1a-2b-3c-4d-ff");
        REQUIRE(a);
        REQUIRE(b);
        CHECK(*a == MacAddr{ 0x00, 0x1a, 0x2b, 0x3c, 0x4d, 0xff });
        CHECK(*a == *b);
        CHECK(macraw_to_str(*a) == "00:1a:2b:3c:4d:ff");
    }
    SECTION("rejects malformed text") {
        CHECK_FALSE(macstr_to_raw(""));
        CHECK_FALSE(macstr_to_raw("00:00:00:00:00"));
        CHECK_FALSE(macstr_to_raw("00:00:00:00:00:0g"));
        CHECK_FALSE(macstr_to_raw("00:00-00:00:00:00"));
        CHECK_FALSE(macstr_to_raw("00:00:00:00:00:00:00"));
    }
}

TEST_CASE("ipaddr") {
    auto a = ip4_from_string("10.0.0.5");
    REQUIRE(a);
    CHECK(*a == Ip4{ 10, 0, 0, 5 });
    CHECK(ip4_to_string(*a) == "10.0.0.5");
    CHECK(ip4_is_any(*ip4_from_string("0.0.0.0")));
    CHECK(*ip4_from_string("255.255.255.255") == ip4_broadcast);
    CHECK_FALSE(ip4_from_string("10.0.0"));
    CHECK_FALSE(ip4_from_string("10.0.0.256"));
    CHECK_FALSE(ip4_from_string("bogus"));

    const uint8_t mask[] = { 255, 255, 255, 0 };
    CHECK(ip4_to_string(mask, 4) == "255.255.255.0");
    CHECK(ip4_to_string(mask, 3) == "ffffff");
}

TEST_CASE("xid sources") {
    FixedXidSource f({ 1, 2 });
    CHECK(f.next_xid() == 1);
    CHECK(f.next_xid() == 2);
    CHECK(f.next_xid() == 1);

    FixedXidSource empty({});
    CHECK(empty.next_xid() == 0);

    sfc64 a(42), b(42);
    CHECK(a() == b());
}
