// Copyright 2014-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <boost/asio/ip/address_v4.hpp>
#include <fmt/format.h>
#include "ipaddr.hpp"

namespace ba = boost::asio;

namespace ndhc4 {

std::optional<Ip4> ip4_from_string(const std::string &s)
{
    boost::system::error_code ec;
    auto a = ba::ip::make_address_v4(s, ec);
    if (ec)
        return std::nullopt;
    return a.to_bytes();
}

std::string ip4_to_string(const Ip4 &ip)
{
    return ba::ip::address_v4(ip).to_string();
}

std::string ip4_to_string(const uint8_t *ip, size_t len)
{
    if (len == 4)
        return fmt::format("{}.{}.{}.{}", ip[0], ip[1], ip[2], ip[3]);
    std::string r;
    for (size_t i = 0; i < len; ++i)
        r += fmt::format("{:02x}", ip[i]);
    return r;
}

}
