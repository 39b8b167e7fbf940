// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_NETBITS_HPP_
#define NDHC4_NETBITS_HPP_

#include <stdint.h>
#include <stddef.h>
#include <array>

namespace ndhc4 {

static inline void encode32be(uint32_t v, void *dest)
{
    auto d = reinterpret_cast<uint8_t *>(dest);
    d[0] = v >> 24;
    d[1] = (v >> 16) & 0xff;
    d[2] = (v >> 8) & 0xff;
    d[3] = v & 0xff;
}

static inline void encode16be(uint16_t v, void *dest)
{
    auto d = reinterpret_cast<uint8_t *>(dest);
    d[0] = v >> 8;
    d[1] = v & 0xff;
}

static inline uint32_t decode32be(const void *src)
{
    auto s = reinterpret_cast<const uint8_t *>(src);
    return (static_cast<uint32_t>(s[0]) << 24)
         | (static_cast<uint32_t>(s[1]) << 16)
         | (static_cast<uint32_t>(s[2]) << 8)
         | static_cast<uint32_t>(s[3]);
}

static inline uint16_t decode16be(const void *src)
{
    auto s = reinterpret_cast<const uint8_t *>(src);
    return static_cast<uint16_t>((s[0] << 8) | s[1]);
}

static inline std::array<uint8_t, 2> u16_to_bytes(uint16_t v)
{
    std::array<uint8_t, 2> r;
    encode16be(v, r.data());
    return r;
}

static inline std::array<uint8_t, 4> u32_to_bytes(uint32_t v)
{
    std::array<uint8_t, 4> r;
    encode32be(v, r.data());
    return r;
}

// Length-checked inverses for values taken off the wire.
//
// A two byte input is decoded big-endian.  Any other non-empty input is
// treated as a single byte holding the value; empty input yields 0.
static inline uint16_t bytes_to_u16(const uint8_t *src, size_t len)
{
    if (!len) return 0;
    if (len != 2) return src[0];
    return decode16be(src);
}

// Inputs shorter than four bytes yield 0; extra bytes are ignored.
static inline uint32_t bytes_to_u32(const uint8_t *src, size_t len)
{
    if (len < 4) return 0;
    return decode32be(src);
}

}

#endif
