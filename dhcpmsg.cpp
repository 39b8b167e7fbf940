// Copyright 2004-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <iterator>
#include <utility>
#include <fmt/format.h>
#include "dhcpmsg.hpp"
#include "netbits.hpp"
#include "sbufs.hpp"

namespace ndhc4 {

MacAddr Message::mac() const
{
    MacAddr r;
    std::copy(chaddr.begin(), chaddr.begin() + r.size(), r.begin());
    return r;
}

bool operator==(const Message &a, const Message &b)
{
    return a.op == b.op && a.htype == b.htype && a.hlen == b.hlen &&
           a.hops == b.hops && a.xid == b.xid && a.secs == b.secs &&
           a.flags == b.flags && a.ciaddr == b.ciaddr &&
           a.yiaddr == b.yiaddr && a.siaddr == b.siaddr &&
           a.giaddr == b.giaddr && a.chaddr == b.chaddr &&
           a.sname == b.sname && a.file == b.file &&
           a.cookie == b.cookie && a.options == b.options &&
           a.type == b.type;
}

static Message request_init(MessageType type, uint32_t xid, uint16_t secs,
                            const MacAddr &mac, const Ip4 &relay)
{
    Message m;
    m.op = BOOTREQUEST;
    m.xid = xid;
    m.secs = secs;
    m.giaddr = relay;
    std::copy(mac.begin(), mac.end(), m.chaddr.begin());
    m.type = type;
    m.options.push_back(make_message_type(type));
    m.options.push_back(make_parameter_list());
    return m;
}

static void append_options(Message &m, const std::vector<Option> &extra)
{
    m.options.insert(m.options.end(), extra.begin(), extra.end());
}

Message build_discover(uint32_t xid, uint16_t secs, const MacAddr &mac,
                       const Ip4 &relay, const std::vector<Option> &extra)
{
    auto m = request_init(MessageType::Discover, xid, secs, mac, relay);
    append_options(m, extra);
    m.options.push_back(make_end());
    return m;
}

Message build_request(const Message &offer, const Ip4 &relay,
                      const std::vector<Option> &extra)
{
    auto m = request_init(MessageType::Request, offer.xid,
                          static_cast<uint16_t>(offer.secs + 1), offer.mac(), relay);
    m.chaddr = offer.chaddr;
    m.options.push_back(make_requested_ip(offer.yiaddr));
    append_options(m, extra);
    if (auto sid = find_option<ServerIdOption>(offer))
        m.options.push_back(*sid);
    if (auto cid = find_option<ClientIdOption>(offer))
        m.options.push_back(*cid);
    m.options.push_back(make_end());
    return m;
}

Message build_decline(uint32_t xid, uint16_t secs, const MacAddr &mac,
                      const Ip4 &relay, const Ip4 &decline_ip,
                      const std::vector<Option> &extra)
{
    auto m = request_init(MessageType::Decline, xid, secs, mac, relay);
    m.options.push_back(make_requested_ip(decline_ip));
    append_options(m, extra);
    m.options.push_back(make_end());
    return m;
}

Message build_release(uint32_t xid, uint16_t secs, const MacAddr &mac,
                      const Ip4 &relay, const Ip4 &release_ip,
                      const std::vector<Option> &extra)
{
    auto m = request_init(MessageType::Release, xid, secs, mac, relay);
    m.ciaddr = release_ip;
    m.options.push_back(make_requested_ip(release_ip));
    append_options(m, extra);
    m.options.push_back(make_end());
    return m;
}

std::vector<uint8_t> encode_message(const Message &m)
{
    std::vector<uint8_t> r;
    r.reserve(DHCP_MIN_MSG_LEN);
    auto put = [&r](const uint8_t *p, size_t n) { r.insert(r.end(), p, p + n); };
    r.push_back(m.op);
    r.push_back(m.htype);
    r.push_back(m.hlen);
    r.push_back(m.hops);
    const auto xid = u32_to_bytes(m.xid);
    put(xid.data(), xid.size());
    const auto secs = u16_to_bytes(m.secs);
    put(secs.data(), secs.size());
    const auto flags = u16_to_bytes(m.flags);
    put(flags.data(), flags.size());
    put(m.ciaddr.data(), m.ciaddr.size());
    put(m.yiaddr.data(), m.yiaddr.size());
    put(m.siaddr.data(), m.siaddr.size());
    put(m.giaddr.data(), m.giaddr.size());
    put(m.chaddr.data(), m.chaddr.size());
    put(m.sname.data(), m.sname.size());
    put(m.file.data(), m.file.size());
    put(m.cookie.data(), m.cookie.size());
    for (const auto &o: m.options)
        encode_option(o, r);
    if (r.size() < DHCP_MIN_MSG_LEN)
        r.resize(DHCP_MIN_MSG_LEN, 0);
    return r;
}

std::optional<Message> decode_message(const uint8_t *buf, size_t len)
{
    if (len < DHCP_HEADER_LEN)
        return std::nullopt;

    Message m;
    sbufs rs{ buf, buf + len };
    if (!rs.read_u8(m.op) || !rs.read_u8(m.htype) || !rs.read_u8(m.hlen) ||
        !rs.read_u8(m.hops) || !rs.read_u32(m.xid) || !rs.read_u16(m.secs) ||
        !rs.read_u16(m.flags) ||
        !rs.read(m.ciaddr.data(), m.ciaddr.size()) ||
        !rs.read(m.yiaddr.data(), m.yiaddr.size()) ||
        !rs.read(m.siaddr.data(), m.siaddr.size()) ||
        !rs.read(m.giaddr.data(), m.giaddr.size()) ||
        !rs.read(m.chaddr.data(), m.chaddr.size()) ||
        !rs.read(m.sname.data(), m.sname.size()) ||
        !rs.read(m.file.data(), m.file.size()) ||
        !rs.read(m.cookie.data(), m.cookie.size()))
        return std::nullopt;

    for (;;) {
        uint8_t code;
        if (!rs.read_u8(code))
            break;
        if (code == static_cast<uint8_t>(OptionCode::End)) {
            m.options.push_back(make_end());
            break;
        }
        if (!is_known_option_code(code))
            break;
        uint8_t olen;
        const uint8_t *payload;
        if (!rs.read_u8(olen) || !rs.skip(olen, payload))
            return std::nullopt;
        auto o = decode_option(code, payload, olen);
        if (!o)
            return std::nullopt;
        if (auto mt = std::get_if<MessageTypeOption>(&*o))
            m.type = mt->type;
        m.options.push_back(std::move(*o));
    }
    return m;
}

std::string render_message(const Message &m)
{
    std::string r;
    auto out = std::back_inserter(r);
    fmt::format_to(out, "Op:{:02x}\n", m.op);
    fmt::format_to(out, "Hardware Type:{:02x}\n", m.htype);
    fmt::format_to(out, "Hardware Address Length:{:02x}\n", m.hlen);
    fmt::format_to(out, "Hops:{:02x}\n", m.hops);
    fmt::format_to(out, "Transaction ID:{:08x}\n", m.xid);
    fmt::format_to(out, "Seconds Elapsed:{}\n", m.secs);
    fmt::format_to(out, "Bootp Flags:{:04x}\n", m.flags);
    fmt::format_to(out, "Client IP Address:{}\n", ip4_to_string(m.ciaddr));
    fmt::format_to(out, "Your (client) IP Address:{}\n", ip4_to_string(m.yiaddr));
    fmt::format_to(out, "Next Server IP Address:{}\n", ip4_to_string(m.siaddr));
    fmt::format_to(out, "Relay Agent IP Address:{}\n", ip4_to_string(m.giaddr));
    fmt::format_to(out, "Client MAC Address:{}\n", macraw_to_str(m.chaddr.data()));
    fmt::format_to(out, "Magic Cookie:{:02x}{:02x}{:02x}{:02x}\n",
                   m.cookie[0], m.cookie[1], m.cookie[2], m.cookie[3]);
    for (const auto &o: m.options)
        fmt::format_to(out, "{}\n", render_option(o));
    return r;
}

}
