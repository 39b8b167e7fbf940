// Copyright 2004-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_OPTIONS_HPP_
#define NDHC4_OPTIONS_HPP_

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "dhcp.hpp"
#include "ipaddr.hpp"
#include "macstr.hpp"

namespace ndhc4 {

enum class OptionCode : uint8_t {
    SubnetMask = 1,
    Router = 3,
    DomainNameServer = 6,
    HostName = 12,
    RequestedIp = 50,
    LeaseTime = 51,
    MessageType = 53,
    ServerId = 54,
    ParameterList = 55,
    MaxMessageSize = 57,
    RenewalTime = 58,
    RebindingTime = 59,
    ClientId = 61,
    Ipv6OnlyPreferred = 108,
    End = 255,
};

// One struct per supported option.  Only the payload is stored; the code
// is implied by the type and the length is recomputed on encode.

struct SubnetMaskOption {
    static constexpr OptionCode code = OptionCode::SubnetMask;
    std::vector<uint8_t> mask;
};
struct RouterOption {
    static constexpr OptionCode code = OptionCode::Router;
    std::vector<Ip4> routers;
};
struct DnsServerOption {
    static constexpr OptionCode code = OptionCode::DomainNameServer;
    std::vector<Ip4> servers;
};
struct HostNameOption {
    static constexpr OptionCode code = OptionCode::HostName;
    std::string name;
};
struct RequestedIpOption {
    static constexpr OptionCode code = OptionCode::RequestedIp;
    Ip4 address;
};
struct LeaseTimeOption {
    static constexpr OptionCode code = OptionCode::LeaseTime;
    uint32_t seconds;
};
struct MessageTypeOption {
    static constexpr OptionCode code = OptionCode::MessageType;
    MessageType type;
};
struct ServerIdOption {
    static constexpr OptionCode code = OptionCode::ServerId;
    Ip4 address;
};
struct ParameterListOption {
    static constexpr OptionCode code = OptionCode::ParameterList;
    std::vector<uint8_t> codes;
};
struct MaxMessageSizeOption {
    static constexpr OptionCode code = OptionCode::MaxMessageSize;
    uint16_t size;
};
struct RenewalTimeOption {
    static constexpr OptionCode code = OptionCode::RenewalTime;
    uint32_t seconds;
};
struct RebindingTimeOption {
    static constexpr OptionCode code = OptionCode::RebindingTime;
    uint32_t seconds;
};
struct ClientIdOption {
    static constexpr OptionCode code = OptionCode::ClientId;
    uint8_t hwtype;
    std::vector<uint8_t> id;
};
// RFC8925.  The value is kept as sent; seconds() is 0 unless it is 4 bytes.
struct Ipv6OnlyPreferredOption {
    static constexpr OptionCode code = OptionCode::Ipv6OnlyPreferred;
    std::vector<uint8_t> value;
    uint32_t seconds() const;
};
struct EndOption {
    static constexpr OptionCode code = OptionCode::End;
};

using Option = std::variant<SubnetMaskOption, RouterOption, DnsServerOption,
                            HostNameOption, RequestedIpOption, LeaseTimeOption,
                            MessageTypeOption, ServerIdOption, ParameterListOption,
                            MaxMessageSizeOption, RenewalTimeOption,
                            RebindingTimeOption, ClientIdOption,
                            Ipv6OnlyPreferredOption, EndOption>;

bool operator==(const SubnetMaskOption &a, const SubnetMaskOption &b);
bool operator==(const RouterOption &a, const RouterOption &b);
bool operator==(const DnsServerOption &a, const DnsServerOption &b);
bool operator==(const HostNameOption &a, const HostNameOption &b);
bool operator==(const RequestedIpOption &a, const RequestedIpOption &b);
bool operator==(const LeaseTimeOption &a, const LeaseTimeOption &b);
bool operator==(const MessageTypeOption &a, const MessageTypeOption &b);
bool operator==(const ServerIdOption &a, const ServerIdOption &b);
bool operator==(const ParameterListOption &a, const ParameterListOption &b);
bool operator==(const MaxMessageSizeOption &a, const MaxMessageSizeOption &b);
bool operator==(const RenewalTimeOption &a, const RenewalTimeOption &b);
bool operator==(const RebindingTimeOption &a, const RebindingTimeOption &b);
bool operator==(const ClientIdOption &a, const ClientIdOption &b);
bool operator==(const Ipv6OnlyPreferredOption &a, const Ipv6OnlyPreferredOption &b);
bool operator==(const EndOption &, const EndOption &);

OptionCode option_code(const Option &o);
bool is_known_option_code(uint8_t code);

// Appends code, length and payload (just the code for End).  Throws
// std::length_error if a variable payload does not fit in 255 bytes.
void encode_option(const Option &o, std::vector<uint8_t> &out);
std::vector<uint8_t> encode_option(const Option &o);

// Decodes a payload of exactly len bytes; the caller has already consumed
// the code and length bytes.  Returns nothing for an unknown code or when
// len is not acceptable for the option.
std::optional<Option> decode_option(uint8_t code, const uint8_t *payload, size_t len);

std::string render_option(const Option &o);

// Generators with the defaults used in outbound messages.
Option make_message_type(MessageType t);
Option make_parameter_list();
Option make_host_name(const std::string &name);
Option make_requested_ip(const Ip4 &ip);
Option make_lease_time(uint32_t seconds);
Option make_max_message_size(uint16_t size);
Option make_client_id(const MacAddr &mac);
Option make_end();

// Option codes requested in every outbound message, in this order.
extern const std::vector<uint8_t> default_parameter_list;

}

#endif
