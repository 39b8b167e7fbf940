// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_DHCPCLIENT_HPP_
#define NDHC4_DHCPCLIENT_HPP_

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/utility.hpp>
#include "dhcpmsg.hpp"
#include "rng.hpp"
#include "transport.hpp"

namespace ndhc4 {

struct ClientConfig {
    std::string server = "255.255.255.255";
    std::string relay = "0.0.0.0";  // 0.0.0.0 means not relayed
    std::string hostname;           // option 12 is sent only if non-empty
    std::string mac = "00:00:00:00:00:00";
    std::chrono::milliseconds timeout{3000};
    uint32_t lease_time = 7776000;
    uint16_t max_message_size = DHCP_MAX_MSG_LEN;
    bool verbose = false;
};

enum class SessionState : uint8_t { Idle, AwaitingOffer, AwaitingAck, Done };

enum class Outcome : uint8_t {
    Bound,            // ACK received
    Nak,              // NAK from the configured server
    Answered,         // Decline/Release got some other reply
    NoResponse,       // receive deadline expired
    TransportFailure, // receive failed for a reason other than the deadline
    Cancelled,
};

const char *session_state_name(SessionState s);
const char *outcome_name(Outcome o);

struct SessionResult {
    Outcome outcome;
    // The server message that ended the exchange, if any.
    std::optional<Message> reply;
};

// One DHCP exchange.  Constructing a session sends its first message and
// starts a thread that receives and answers replies until the exchange is
// over.  All protocol state is written only by that thread.
//
// The factories throw ConfigError for unparsable addresses or a host name
// over 255 bytes, BindError if
// the listen port can't be bound and TransportError if the first send
// fails.  Destroying a session that is still running cancels it.
class ClientSession : boost::noncopyable
{
    struct Token {};
public:
    enum class Kind : uint8_t { Acquire, Decline, Release };

    static std::unique_ptr<ClientSession>
    acquire(const ClientConfig &cfg, std::unique_ptr<DatagramTransport> transport,
            XidSource &xids);
    static std::unique_ptr<ClientSession>
    decline(const ClientConfig &cfg, const std::string &ip,
            std::unique_ptr<DatagramTransport> transport, XidSource &xids);
    static std::unique_ptr<ClientSession>
    release(const ClientConfig &cfg, const std::string &ip,
            std::unique_ptr<DatagramTransport> transport, XidSource &xids);

    // Use the factories; Token keeps this constructor private to them.
    ClientSession(Token, Kind kind, const ClientConfig &cfg, const std::string &target,
                  std::unique_ptr<DatagramTransport> transport, XidSource &xids);
    ~ClientSession();

    // Blocks until the session is done.  May be called more than once.
    SessionResult wait() const;
    // Empty if the session is not done by the deadline.
    std::optional<SessionResult> wait_for(std::chrono::milliseconds d) const;
    bool done() const;

    // Stops the receive thread and releases the transport.  Completes
    // the session as Cancelled unless it had already finished.
    void cancel();

    SessionState state() const { return state_; }
    uint32_t xid() const { return xid_; }
    bool relayed() const { return relayed_; }
    uint16_t listen_port() const { return relayed_ ? DHCP_SERVER_PORT : DHCP_CLIENT_PORT; }

    static constexpr unsigned kMaxRetries = 1;
private:
    Message first_message() const;
    Message discover() const;
    std::vector<Option> identity_options() const;
    boost::system::error_code send(const Message &m);
    void receive_loop();
    // Returns true when the exchange is over.
    bool handle(const Datagram &dg);
    bool handle_nak(const Message &m, const Ip4 &source);
    void finish(Outcome outcome, std::optional<Message> reply);
    void release_transport();
    void complete(SessionResult r);

    const Kind kind_;
    ClientConfig cfg_;
    Ip4 server_;
    Ip4 relay_;
    Ip4 target_;
    MacAddr mac_;
    bool relayed_;
    uint32_t xid_;
    uint16_t secs_;
    unsigned retries_;
    std::atomic<SessionState> state_;
    std::chrono::steady_clock::time_point deadline_;

    std::unique_ptr<DatagramTransport> transport_;
    std::once_flag transport_released_;

    std::promise<SessionResult> promise_;
    std::shared_future<SessionResult> result_;
    std::once_flag completed_;

    std::atomic<bool> stop_;
    std::thread thread_;
};

}

#endif
