// Copyright 2004-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <fmt/format.h>
#include "options.hpp"
#include "netbits.hpp"

namespace ndhc4 {

const std::vector<uint8_t> default_parameter_list{
    1,   // subnet mask
    3,   // router
    6,   // dns servers
    15,  // domain name
    46,  // netbios node type
    108, // ipv6-only preferred
    114, // captive portal
    119, // domain search
    121, // classless static routes
    252, // proxy autodiscovery
};

const char *message_type_name(MessageType t)
{
    switch (t) {
    case MessageType::Discover: return "DISCOVER";
    case MessageType::Offer: return "OFFER";
    case MessageType::Request: return "REQUEST";
    case MessageType::Decline: return "DECLINE";
    case MessageType::Ack: return "ACK";
    case MessageType::Nak: return "NAK";
    case MessageType::Release: return "RELEASE";
    case MessageType::None: break;
    }
    return "UNKNOWN";
}

bool operator==(const SubnetMaskOption &a, const SubnetMaskOption &b) { return a.mask == b.mask; }
bool operator==(const RouterOption &a, const RouterOption &b) { return a.routers == b.routers; }
bool operator==(const DnsServerOption &a, const DnsServerOption &b) { return a.servers == b.servers; }
bool operator==(const HostNameOption &a, const HostNameOption &b) { return a.name == b.name; }
bool operator==(const RequestedIpOption &a, const RequestedIpOption &b) { return a.address == b.address; }
bool operator==(const LeaseTimeOption &a, const LeaseTimeOption &b) { return a.seconds == b.seconds; }
bool operator==(const MessageTypeOption &a, const MessageTypeOption &b) { return a.type == b.type; }
bool operator==(const ServerIdOption &a, const ServerIdOption &b) { return a.address == b.address; }
bool operator==(const ParameterListOption &a, const ParameterListOption &b) { return a.codes == b.codes; }
bool operator==(const MaxMessageSizeOption &a, const MaxMessageSizeOption &b) { return a.size == b.size; }
bool operator==(const RenewalTimeOption &a, const RenewalTimeOption &b) { return a.seconds == b.seconds; }
bool operator==(const RebindingTimeOption &a, const RebindingTimeOption &b) { return a.seconds == b.seconds; }
bool operator==(const ClientIdOption &a, const ClientIdOption &b) { return a.hwtype == b.hwtype && a.id == b.id; }
bool operator==(const Ipv6OnlyPreferredOption &a, const Ipv6OnlyPreferredOption &b) { return a.value == b.value; }
bool operator==(const EndOption &, const EndOption &) { return true; }

uint32_t Ipv6OnlyPreferredOption::seconds() const
{
    if (value.size() != 4) return 0;
    return bytes_to_u32(value.data(), value.size());
}

OptionCode option_code(const Option &o)
{
    return std::visit([](const auto &v) { return std::decay_t<decltype(v)>::code; }, o);
}

bool is_known_option_code(uint8_t code)
{
    switch (static_cast<OptionCode>(code)) {
    case OptionCode::SubnetMask:
    case OptionCode::Router:
    case OptionCode::DomainNameServer:
    case OptionCode::HostName:
    case OptionCode::RequestedIp:
    case OptionCode::LeaseTime:
    case OptionCode::MessageType:
    case OptionCode::ServerId:
    case OptionCode::ParameterList:
    case OptionCode::MaxMessageSize:
    case OptionCode::RenewalTime:
    case OptionCode::RebindingTime:
    case OptionCode::ClientId:
    case OptionCode::Ipv6OnlyPreferred:
    case OptionCode::End:
        return true;
    }
    return false;
}

namespace {

struct EncodeVisitor
{
    std::vector<uint8_t> &out;

    void header(OptionCode code, size_t len)
    {
        if (len > 255)
            throw std::length_error(fmt::format("option {} payload is {} bytes",
                                                static_cast<unsigned>(code), len));
        out.push_back(static_cast<uint8_t>(code));
        out.push_back(static_cast<uint8_t>(len));
    }
    void bytes(const uint8_t *p, size_t n) { out.insert(out.end(), p, p + n); }
    void u32(OptionCode code, uint32_t v)
    {
        header(code, 4);
        const auto b = u32_to_bytes(v);
        bytes(b.data(), b.size());
    }
    void iplist(OptionCode code, const std::vector<Ip4> &l)
    {
        header(code, l.size() * 4);
        for (const auto &i: l) bytes(i.data(), i.size());
    }

    void operator()(const SubnetMaskOption &o) { header(o.code, o.mask.size()); bytes(o.mask.data(), o.mask.size()); }
    void operator()(const RouterOption &o) { iplist(o.code, o.routers); }
    void operator()(const DnsServerOption &o) { iplist(o.code, o.servers); }
    void operator()(const HostNameOption &o)
    {
        header(o.code, o.name.size());
        bytes(reinterpret_cast<const uint8_t *>(o.name.data()), o.name.size());
    }
    void operator()(const RequestedIpOption &o) { header(o.code, 4); bytes(o.address.data(), 4); }
    void operator()(const LeaseTimeOption &o) { u32(o.code, o.seconds); }
    void operator()(const MessageTypeOption &o)
    {
        header(o.code, 1);
        out.push_back(static_cast<uint8_t>(o.type));
    }
    void operator()(const ServerIdOption &o) { header(o.code, 4); bytes(o.address.data(), 4); }
    void operator()(const ParameterListOption &o) { header(o.code, o.codes.size()); bytes(o.codes.data(), o.codes.size()); }
    void operator()(const MaxMessageSizeOption &o)
    {
        header(o.code, 2);
        const auto b = u16_to_bytes(o.size);
        bytes(b.data(), b.size());
    }
    void operator()(const RenewalTimeOption &o) { u32(o.code, o.seconds); }
    void operator()(const RebindingTimeOption &o) { u32(o.code, o.seconds); }
    void operator()(const ClientIdOption &o)
    {
        header(o.code, 1 + o.id.size());
        out.push_back(o.hwtype);
        bytes(o.id.data(), o.id.size());
    }
    void operator()(const Ipv6OnlyPreferredOption &o) { header(o.code, o.value.size()); bytes(o.value.data(), o.value.size()); }
    void operator()(const EndOption &o) { out.push_back(static_cast<uint8_t>(o.code)); }
};

std::string hexstr(const uint8_t *p, size_t n)
{
    std::string r;
    for (size_t i = 0; i < n; ++i) r += fmt::format("{:02x}", p[i]);
    return r;
}

std::string iplist_str(const std::vector<Ip4> &l)
{
    std::string r;
    for (const auto &i: l) {
        if (!r.empty()) r.push_back(' ');
        r += ip4_to_string(i);
    }
    return r;
}

struct RenderVisitor
{
    std::string head(OptionCode code, size_t len) const
    {
        return fmt::format("Option:({}) Length:{}", static_cast<unsigned>(code), len);
    }

    std::string operator()(const SubnetMaskOption &o) const
    {
        return head(o.code, o.mask.size()) + " Subnet Mask:" + ip4_to_string(o.mask.data(), o.mask.size());
    }
    std::string operator()(const RouterOption &o) const
    {
        return head(o.code, o.routers.size() * 4) + " Routers:" + iplist_str(o.routers);
    }
    std::string operator()(const DnsServerOption &o) const
    {
        return head(o.code, o.servers.size() * 4) + " Domain Name Servers:" + iplist_str(o.servers);
    }
    std::string operator()(const HostNameOption &o) const
    {
        return head(o.code, o.name.size()) + " Host Name:" + o.name;
    }
    std::string operator()(const RequestedIpOption &o) const
    {
        return head(o.code, 4) + " Requested IP Address:" + ip4_to_string(o.address);
    }
    std::string operator()(const LeaseTimeOption &o) const
    {
        return head(o.code, 4) + fmt::format(" IP Address Lease Time:{}", o.seconds);
    }
    std::string operator()(const MessageTypeOption &o) const
    {
        return head(o.code, 1) + " DHCP:" + message_type_name(o.type);
    }
    std::string operator()(const ServerIdOption &o) const
    {
        return head(o.code, 4) + " Server Identifier:" + ip4_to_string(o.address);
    }
    std::string operator()(const ParameterListOption &o) const
    {
        auto r = head(o.code, o.codes.size()) + " Parameter Request List:";
        for (const auto &c: o.codes) r += fmt::format(" {}", c);
        return r;
    }
    std::string operator()(const MaxMessageSizeOption &o) const
    {
        return head(o.code, 2) + fmt::format(" Maximum DHCP Message Size:{}", o.size);
    }
    std::string operator()(const RenewalTimeOption &o) const
    {
        return head(o.code, 4) + fmt::format(" Renewal Time Value:{}", o.seconds);
    }
    std::string operator()(const RebindingTimeOption &o) const
    {
        return head(o.code, 4) + fmt::format(" Rebinding Time Value:{}", o.seconds);
    }
    std::string operator()(const ClientIdOption &o) const
    {
        auto r = head(o.code, 1 + o.id.size()) + fmt::format(" Hardware Type:{} Client Identifier:", o.hwtype);
        if (o.hwtype == 1 && o.id.size() == 6)
            return r + macraw_to_str(o.id.data());
        return r + hexstr(o.id.data(), o.id.size());
    }
    std::string operator()(const Ipv6OnlyPreferredOption &o) const
    {
        return head(o.code, o.value.size()) + fmt::format(" IPv6-Only Preferred:{}", o.seconds());
    }
    std::string operator()(const EndOption &o) const
    {
        return fmt::format("Option:({}) End", static_cast<unsigned>(o.code));
    }
};

std::optional<std::vector<Ip4>> decode_iplist(const uint8_t *p, size_t len)
{
    if (len % 4)
        return std::nullopt;
    std::vector<Ip4> r;
    for (size_t i = 0; i < len; i += 4)
        r.push_back(Ip4{ p[i], p[i + 1], p[i + 2], p[i + 3] });
    return r;
}

Ip4 decode_ip(const uint8_t *p)
{
    return Ip4{ p[0], p[1], p[2], p[3] };
}

}

void encode_option(const Option &o, std::vector<uint8_t> &out)
{
    std::visit(EncodeVisitor{ out }, o);
}

std::vector<uint8_t> encode_option(const Option &o)
{
    std::vector<uint8_t> r;
    encode_option(o, r);
    return r;
}

std::optional<Option> decode_option(uint8_t code, const uint8_t *p, size_t len)
{
    switch (static_cast<OptionCode>(code)) {
    case OptionCode::SubnetMask:
        return SubnetMaskOption{ std::vector<uint8_t>(p, p + len) };
    case OptionCode::Router: {
        auto l = decode_iplist(p, len);
        if (!l) return std::nullopt;
        return RouterOption{ std::move(*l) };
    }
    case OptionCode::DomainNameServer: {
        auto l = decode_iplist(p, len);
        if (!l) return std::nullopt;
        return DnsServerOption{ std::move(*l) };
    }
    case OptionCode::HostName:
        return HostNameOption{ std::string(reinterpret_cast<const char *>(p), len) };
    case OptionCode::RequestedIp:
        if (len != 4) return std::nullopt;
        return RequestedIpOption{ decode_ip(p) };
    case OptionCode::LeaseTime:
        if (len != 4) return std::nullopt;
        return LeaseTimeOption{ bytes_to_u32(p, len) };
    case OptionCode::MessageType:
        if (len != 1) return std::nullopt;
        return MessageTypeOption{ static_cast<MessageType>(p[0]) };
    case OptionCode::ServerId:
        if (len != 4) return std::nullopt;
        return ServerIdOption{ decode_ip(p) };
    case OptionCode::ParameterList:
        return ParameterListOption{ std::vector<uint8_t>(p, p + len) };
    case OptionCode::MaxMessageSize:
        if (len != 2) return std::nullopt;
        return MaxMessageSizeOption{ bytes_to_u16(p, len) };
    case OptionCode::RenewalTime:
        if (len != 4) return std::nullopt;
        return RenewalTimeOption{ bytes_to_u32(p, len) };
    case OptionCode::RebindingTime:
        if (len != 4) return std::nullopt;
        return RebindingTimeOption{ bytes_to_u32(p, len) };
    case OptionCode::ClientId:
        if (len < 1) return std::nullopt;
        return ClientIdOption{ p[0], std::vector<uint8_t>(p + 1, p + len) };
    case OptionCode::Ipv6OnlyPreferred:
        return Ipv6OnlyPreferredOption{ std::vector<uint8_t>(p, p + len) };
    case OptionCode::End:
        return EndOption{};
    }
    return std::nullopt;
}

std::string render_option(const Option &o)
{
    return std::visit(RenderVisitor{}, o);
}

Option make_message_type(MessageType t) { return MessageTypeOption{ t }; }
Option make_parameter_list() { return ParameterListOption{ default_parameter_list }; }
Option make_host_name(const std::string &name) { return HostNameOption{ name }; }
Option make_requested_ip(const Ip4 &ip) { return RequestedIpOption{ ip }; }
Option make_lease_time(uint32_t seconds) { return LeaseTimeOption{ seconds }; }
Option make_max_message_size(uint16_t size) { return MaxMessageSizeOption{ size }; }
Option make_client_id(const MacAddr &mac)
{
    return ClientIdOption{ 1, std::vector<uint8_t>(mac.begin(), mac.end()) };
}
Option make_end() { return EndOption{}; }

}
