// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <utility>
#include <fmt/format.h>
#include "dhcpclient.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace ba = boost::asio;

namespace ndhc4 {

const char *session_state_name(SessionState s)
{
    switch (s) {
    case SessionState::Idle: return "idle";
    case SessionState::AwaitingOffer: return "awaiting offer";
    case SessionState::AwaitingAck: return "awaiting ack";
    case SessionState::Done: return "done";
    }
    return "unknown";
}

const char *outcome_name(Outcome o)
{
    switch (o) {
    case Outcome::Bound: return "bound";
    case Outcome::Nak: return "nak";
    case Outcome::Answered: return "answered";
    case Outcome::NoResponse: return "no response";
    case Outcome::TransportFailure: return "transport failure";
    case Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

static Ip4 parse_ip(const std::string &s, const char *what)
{
    auto r = ip4_from_string(s);
    if (!r)
        throw ConfigError(fmt::format("invalid {} address: '{}'", what, s));
    return *r;
}

std::unique_ptr<ClientSession>
ClientSession::acquire(const ClientConfig &cfg,
                       std::unique_ptr<DatagramTransport> transport, XidSource &xids)
{
    return std::make_unique<ClientSession>(Token{}, Kind::Acquire, cfg, "0.0.0.0",
                                           std::move(transport), xids);
}

std::unique_ptr<ClientSession>
ClientSession::decline(const ClientConfig &cfg, const std::string &ip,
                       std::unique_ptr<DatagramTransport> transport, XidSource &xids)
{
    return std::make_unique<ClientSession>(Token{}, Kind::Decline, cfg, ip,
                                           std::move(transport), xids);
}

std::unique_ptr<ClientSession>
ClientSession::release(const ClientConfig &cfg, const std::string &ip,
                       std::unique_ptr<DatagramTransport> transport, XidSource &xids)
{
    return std::make_unique<ClientSession>(Token{}, Kind::Release, cfg, ip,
                                           std::move(transport), xids);
}

ClientSession::ClientSession(Token, Kind kind, const ClientConfig &cfg,
                             const std::string &target,
                             std::unique_ptr<DatagramTransport> transport,
                             XidSource &xids)
 : kind_(kind), cfg_(cfg), secs_(0), retries_(0), state_(SessionState::Idle),
   transport_(std::move(transport)), result_(promise_.get_future().share()),
   stop_(false)
{
    auto mac = macstr_to_raw(cfg_.mac);
    if (!mac)
        throw ConfigError(fmt::format("invalid MAC address: '{}'", cfg_.mac));
    mac_ = *mac;
    server_ = parse_ip(cfg_.server, "server");
    relay_ = parse_ip(cfg_.relay, "relay");
    target_ = parse_ip(target, "target");
    if (cfg_.hostname.size() > 255)
        throw ConfigError(fmt::format("host name is {} bytes, longer than 255",
                                      cfg_.hostname.size()));
    if (!transport_)
        throw TransportError("no transport supplied");
    relayed_ = !ip4_is_any(relay_);
    xid_ = xids.next_xid();

    transport_->open(ip4_any, listen_port());

    const auto m = first_message();
    if (auto ec = send(m)) {
        transport_->close();
        throw TransportError(fmt::format("failed to send {}: {}",
                                         message_type_name(m.type), ec.message()));
    }
    state_ = kind_ == Kind::Acquire ? SessionState::AwaitingOffer
                                    : SessionState::AwaitingAck;
    thread_ = std::thread([this] { receive_loop(); });
}

ClientSession::~ClientSession()
{
    cancel();
}

std::vector<Option> ClientSession::identity_options() const
{
    std::vector<Option> r;
    r.push_back(make_client_id(mac_));
    if (!cfg_.hostname.empty())
        r.push_back(make_host_name(cfg_.hostname));
    return r;
}

Message ClientSession::discover() const
{
    std::vector<Option> extra{ make_lease_time(cfg_.lease_time),
                               make_max_message_size(cfg_.max_message_size) };
    const auto id = identity_options();
    extra.insert(extra.end(), id.begin(), id.end());
    return build_discover(xid_, secs_, mac_, relay_, extra);
}

Message ClientSession::first_message() const
{
    switch (kind_) {
    case Kind::Decline:
        return build_decline(xid_, secs_, mac_, relay_, target_, identity_options());
    case Kind::Release:
        return build_release(xid_, secs_, mac_, relay_, target_, identity_options());
    case Kind::Acquire:
        break;
    }
    return discover();
}

boost::system::error_code ClientSession::send(const Message &m)
{
    log_line("dhcp4: send {} xid={:08x} to {}:{}\n", message_type_name(m.type),
             m.xid, ip4_to_string(server_), DHCP_SERVER_PORT);
    if (cfg_.verbose)
        log_line("{}", render_message(m));
    auto ec = transport_->send_to(encode_message(m), server_, DHCP_SERVER_PORT);
    deadline_ = std::chrono::steady_clock::now() + cfg_.timeout;
    return ec;
}

void ClientSession::receive_loop()
{
    Datagram dg;
    for (;;) {
        const auto now = std::chrono::steady_clock::now();
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
        if (remaining.count() < 0)
            remaining = std::chrono::milliseconds(0);
        const auto ec = transport_->receive(dg, remaining);
        if (stop_)
            return;
        if (ec == ba::error::timed_out) {
            log_line("dhcp4: xid={:08x}: no reply within {} ms\n", xid_,
                     cfg_.timeout.count());
            finish(Outcome::NoResponse, std::nullopt);
            return;
        }
        if (ec) {
            log_line("dhcp4: xid={:08x}: receive failed: {}\n", xid_, ec.message());
            finish(Outcome::TransportFailure, std::nullopt);
            return;
        }
        if (handle(dg))
            return;
    }
}

bool ClientSession::handle(const Datagram &dg)
{
    auto m = decode_message(dg.data);
    if (!m) {
        log_line("dhcp4: malformed message ({} bytes) from {}\n",
                 dg.data.size(), ip4_to_string(dg.source));
        return false;
    }
    if (m->xid != xid_ || m->op != BOOTREPLY)
        return false;
    if (m->cookie != DHCP_MAGIC_BYTES) {
        log_line("dhcp4: ignoring message with bad magic cookie from {}\n",
                 ip4_to_string(dg.source));
        return false;
    }
    log_line("dhcp4: recv {} xid={:08x} from {}\n", message_type_name(m->type),
             m->xid, ip4_to_string(dg.source));
    if (cfg_.verbose)
        log_line("{}", render_message(*m));

    if (m->type == MessageType::Nak)
        return handle_nak(*m, dg.source);

    switch (state_.load()) {
    case SessionState::AwaitingOffer: {
        if (m->type != MessageType::Offer)
            return false;
        retries_ = 0;
        std::vector<Option> extra;
        if (!cfg_.hostname.empty())
            extra.push_back(make_host_name(cfg_.hostname));
        const auto req = build_request(*m, relay_, extra);
        secs_ = req.secs;
        if (auto ec = send(req)) {
            log_line("dhcp4: failed to send REQUEST: {}\n", ec.message());
            finish(Outcome::TransportFailure, std::nullopt);
            return true;
        }
        state_ = SessionState::AwaitingAck;
        return false;
    }
    case SessionState::AwaitingAck:
        if (m->type == MessageType::Ack) {
            finish(Outcome::Bound, std::move(*m));
            return true;
        }
        if (kind_ != Kind::Acquire) {
            finish(Outcome::Answered, std::move(*m));
            return true;
        }
        return false;
    case SessionState::Idle:
    case SessionState::Done:
        break;
    }
    return false;
}

bool ClientSession::handle_nak(const Message &m, const Ip4 &source)
{
    if (state_ == SessionState::AwaitingOffer && ++retries_ <= kMaxRetries) {
        if (auto ec = send(discover())) {
            log_line("dhcp4: failed to resend DISCOVER: {}\n", ec.message());
            finish(Outcome::TransportFailure, std::nullopt);
            return true;
        }
        return false;
    }
    if (source != server_) {
        log_line("dhcp4: ignoring NAK from {}, expected {}\n",
                 ip4_to_string(source), ip4_to_string(server_));
        return false;
    }
    finish(Outcome::Nak, m);
    return true;
}

void ClientSession::finish(Outcome outcome, std::optional<Message> reply)
{
    // A timed out or failed exchange keeps the state it was waiting in.
    if (outcome != Outcome::NoResponse && outcome != Outcome::TransportFailure)
        state_ = SessionState::Done;
    release_transport();
    complete(SessionResult{ outcome, std::move(reply) });
}

void ClientSession::release_transport()
{
    std::call_once(transport_released_, [this] { transport_->close(); });
}

void ClientSession::complete(SessionResult r)
{
    std::call_once(completed_, [this, &r] { promise_.set_value(std::move(r)); });
}

void ClientSession::cancel()
{
    stop_ = true;
    transport_->interrupt();
    if (thread_.joinable())
        thread_.join();
    release_transport();
    complete(SessionResult{ Outcome::Cancelled, std::nullopt });
}

SessionResult ClientSession::wait() const
{
    return result_.get();
}

std::optional<SessionResult> ClientSession::wait_for(std::chrono::milliseconds d) const
{
    if (result_.wait_for(d) != std::future_status::ready)
        return std::nullopt;
    return result_.get();
}

bool ClientSession::done() const
{
    return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}
