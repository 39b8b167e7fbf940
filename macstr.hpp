// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_MACSTR_HPP_
#define NDHC4_MACSTR_HPP_

#include <stdint.h>
#include <array>
#include <optional>
#include <string>

namespace ndhc4 {

using MacAddr = std::array<uint8_t, 6>;

// Accepts six hex octets separated by either ':' or '-'.
bool is_macstr(const std::string &ms);
std::optional<MacAddr> macstr_to_raw(const std::string &macstr);
std::string macraw_to_str(const uint8_t *macraw);
static inline std::string macraw_to_str(const MacAddr &mac) { return macraw_to_str(mac.data()); }

}

#endif
