// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
// Big-endian helpers and their behaviour on short input.

#include <catch2/catch.hpp>
#include "netbits.hpp"
#include "sbufs.hpp"

using namespace ndhc4;

TEST_CASE("netbits: fixed width encoders") {
    CHECK(u16_to_bytes(0x05dc) == std::array<uint8_t, 2>{ 0x05, 0xdc });
    CHECK(u32_to_bytes(7776000) == std::array<uint8_t, 4>{ 0x00, 0x76, 0xa7, 0x00 });
    const uint8_t b[] = { 0xde, 0xad, 0xbe, 0xef };
    CHECK(decode32be(b) == 0xdeadbeefu);
    CHECK(decode16be(b) == 0xdeadu);
}

TEST_CASE("netbits: length checked decoders") {
    const uint8_t b[] = { 0x01, 0x02, 0x03, 0x04, 0x05 };

    SECTION("u16") {
        CHECK(bytes_to_u16(b, 2) == 0x0102);
        CHECK(bytes_to_u16(b, 0) == 0);
        CHECK(bytes_to_u16(b, 1) == 0x01);
        CHECK(bytes_to_u16(b, 3) == 0x01);
    }
    SECTION("u32") {
        CHECK(bytes_to_u32(b, 4) == 0x01020304u);
        CHECK(bytes_to_u32(b, 5) == 0x01020304u);
        CHECK(bytes_to_u32(b, 3) == 0);
        CHECK(bytes_to_u32(b, 0) == 0);
    }
}

TEST_CASE("sbufs: reads never run past the end") {
    const uint8_t b[] = { 0x12, 0x34, 0x56 };
    sbufs rs{ b, b + sizeof b };
    uint16_t v16 = 0;
    uint32_t v32 = 0;
    REQUIRE(rs.read_u16(v16));
    CHECK(v16 == 0x1234);
    CHECK_FALSE(rs.read_u32(v32));
    CHECK(rs.brem() == 1);
    const uint8_t *p = nullptr;
    CHECK_FALSE(rs.skip(2, p));
    REQUIRE(rs.skip(1, p));
    CHECK(*p == 0x56);
    CHECK(rs.brem() == 0);
}
