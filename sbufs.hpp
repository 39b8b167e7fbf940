// Copyright 2020-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_SBUFS_HPP_
#define NDHC4_SBUFS_HPP_

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include "netbits.hpp"

namespace ndhc4 {

// Read cursor over [si, se).  Every read is checked against the end;
// a failed read consumes nothing.
struct sbufs {
    const uint8_t *si;
    const uint8_t *se;

    size_t brem() const { return se > si ? static_cast<size_t>(se - si) : 0; }

    [[nodiscard]] bool read(void *out, size_t n)
    {
        if (n > brem()) return false;
        memcpy(out, si, n);
        si += n;
        return true;
    }
    [[nodiscard]] bool read_u8(uint8_t &v) { return read(&v, 1); }
    [[nodiscard]] bool read_u16(uint16_t &v)
    {
        uint8_t b[2];
        if (!read(b, sizeof b)) return false;
        v = decode16be(b);
        return true;
    }
    [[nodiscard]] bool read_u32(uint32_t &v)
    {
        uint8_t b[4];
        if (!read(b, sizeof b)) return false;
        v = decode32be(b);
        return true;
    }
    // Hands out a pointer to the next n bytes instead of copying them.
    [[nodiscard]] bool skip(size_t n, const uint8_t *&out)
    {
        if (n > brem()) return false;
        out = si;
        si += n;
        return true;
    }
};

}

#endif
