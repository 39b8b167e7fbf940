// Copyright 2014-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_IPADDR_HPP_
#define NDHC4_IPADDR_HPP_

#include <stdint.h>
#include <array>
#include <optional>
#include <string>

namespace ndhc4 {

// IPv4 address in network byte order, exactly as it appears on the wire.
using Ip4 = std::array<uint8_t, 4>;

static constexpr Ip4 ip4_any{ 0, 0, 0, 0 };
static constexpr Ip4 ip4_broadcast{ 255, 255, 255, 255 };

std::optional<Ip4> ip4_from_string(const std::string &s);
std::string ip4_to_string(const Ip4 &ip);
// For lengths other than 4 the bytes are printed as hex.
std::string ip4_to_string(const uint8_t *ip, size_t len);

static inline bool ip4_is_any(const Ip4 &ip) { return ip == ip4_any; }

}

#endif
