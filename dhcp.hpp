// Copyright 2004-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_DHCP_HPP_
#define NDHC4_DHCP_HPP_

#include <stdint.h>
#include <stddef.h>
#include <array>

namespace ndhc4 {

static constexpr uint16_t DHCP_SERVER_PORT = 67;
static constexpr uint16_t DHCP_CLIENT_PORT = 68;
static constexpr uint32_t DHCP_MAGIC = 0x63825363;
static constexpr std::array<uint8_t, 4> DHCP_MAGIC_BYTES{ 0x63, 0x82, 0x53, 0x63 };

// op + htype + hlen + hops + xid + secs + flags + 4 addresses + chaddr +
// sname + file + cookie
static constexpr size_t DHCP_HEADER_LEN = 240;
// BOOTP minimum; shorter datagrams are zero padded.
static constexpr size_t DHCP_MIN_MSG_LEN = 300;
// Large enough for any datagram an ethernet link will deliver.
static constexpr size_t DHCP_MAX_MSG_LEN = 1500;

enum : uint8_t {
    BOOTREQUEST = 1,
    BOOTREPLY = 2,
};

enum class MessageType : uint8_t {
    None = 0,
    Discover = 1,
    Offer = 2,
    Request = 3,
    Decline = 4,
    Ack = 5,
    Nak = 6,
    Release = 7,
};

const char *message_type_name(MessageType t);

}

#endif
