// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <ctype.h>
#include <stdlib.h>
#include <fmt/format.h>
#include "macstr.hpp"

namespace ndhc4 {

std::string macraw_to_str(const uint8_t *macraw)
{
    return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
                       macraw[0], macraw[1], macraw[2],
                       macraw[3], macraw[4], macraw[5]);
}

bool is_macstr(const std::string &ms)
{
    if (ms.size() != 17)
        return false;
    const char sep = ms[2];
    if (sep != ':' && sep != '-')
        return false;
    for (size_t i = 0; i < 6; ++i) {
        if (!isxdigit(static_cast<unsigned char>(ms[3*i])) ||
            !isxdigit(static_cast<unsigned char>(ms[3*i + 1])))
            return false;
        if (i < 5 && ms[3*i + 2] != sep)
            return false;
    }
    return true;
}

std::optional<MacAddr> macstr_to_raw(const std::string &macstr)
{
    if (!is_macstr(macstr))
        return std::nullopt;
    MacAddr r;
    for (size_t i = 0; i < 6; ++i)
        r[i] = static_cast<uint8_t>(strtol(macstr.c_str() + 3*i, nullptr, 16));
    return r;
}

}
