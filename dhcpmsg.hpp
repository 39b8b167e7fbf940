// Copyright 2004-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_DHCPMSG_HPP_
#define NDHC4_DHCPMSG_HPP_

#include <stdint.h>
#include <stddef.h>
#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "dhcp.hpp"
#include "ipaddr.hpp"
#include "macstr.hpp"
#include "options.hpp"

namespace ndhc4 {

struct Message {
    uint8_t op = BOOTREQUEST; // BOOTREQUEST from clients, BOOTREPLY from servers
    uint8_t htype = 1;        // ARP hardware type: 1 for ethernet
    uint8_t hlen = 6;         // Hardware address length
    uint8_t hops = 0;         // Incremented by relay agents
    uint32_t xid = 0;         // Transaction ID chosen by the client
    uint16_t secs = 0;        // Seconds since the client began the exchange
    uint16_t flags = 0;
    Ip4 ciaddr{};             // Client IP, only set when it already holds one
    Ip4 yiaddr{};             // 'your' (client) IP offered by the server
    Ip4 siaddr{};             // Next server in the bootstrap
    Ip4 giaddr{};             // Relay agent IP
    std::array<uint8_t, 16> chaddr{}; // MAC followed by 10 bytes of padding
    std::array<uint8_t, 64> sname{};
    std::array<uint8_t, 128> file{};
    std::array<uint8_t, 4> cookie = DHCP_MAGIC_BYTES;
    std::vector<Option> options;
    // Mirrors option 53; None if the message did not carry one.
    MessageType type = MessageType::None;

    MacAddr mac() const;
};

bool operator==(const Message &a, const Message &b);
static inline bool operator!=(const Message &a, const Message &b) { return !(a == b); }

template <typename T>
const T *find_option(const Message &m)
{
    for (const auto &o: m.options) {
        if (auto r = std::get_if<T>(&o))
            return r;
    }
    return nullptr;
}

// Outbound messages.  relay is copied into giaddr; 0.0.0.0 means the
// message is not relayed.  extra options follow the fixed leading ones
// and precede the End option.
Message build_discover(uint32_t xid, uint16_t secs, const MacAddr &mac,
                       const Ip4 &relay, const std::vector<Option> &extra);
// Reuses xid and chaddr from the offer, secs is the offer's plus one.
// Server and client identifiers present in the offer are copied verbatim.
Message build_request(const Message &offer, const Ip4 &relay,
                      const std::vector<Option> &extra);
Message build_decline(uint32_t xid, uint16_t secs, const MacAddr &mac,
                      const Ip4 &relay, const Ip4 &decline_ip,
                      const std::vector<Option> &extra);
Message build_release(uint32_t xid, uint16_t secs, const MacAddr &mac,
                      const Ip4 &relay, const Ip4 &release_ip,
                      const std::vector<Option> &extra);

// Zero padded to DHCP_MIN_MSG_LEN; longer messages are never truncated.
std::vector<uint8_t> encode_message(const Message &m);

// Returns nothing if the datagram is malformed: shorter than the fixed
// header, or an option that runs past the end of the buffer or has a
// length its type does not allow.  Option parsing stops at End, at an
// unknown option code, or when the buffer ends on an option boundary.
std::optional<Message> decode_message(const uint8_t *buf, size_t len);
static inline std::optional<Message> decode_message(const std::vector<uint8_t> &buf)
{
    return decode_message(buf.data(), buf.size());
}

std::string render_message(const Message &m);

}

#endif
