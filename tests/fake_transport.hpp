// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_TESTS_FAKE_TRANSPORT_HPP_
#define NDHC4_TESTS_FAKE_TRANSPORT_HPP_

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>
#include "dhcpmsg.hpp"
#include "errors.hpp"
#include "transport.hpp"

namespace ndhc4 { namespace test {

// State shared between a test and the transport it hands to a session,
// so the test can script replies and inspect traffic after the session
// has taken ownership of the transport.
struct FakeWire {
    struct Inbound {
        Datagram dg;
        boost::system::error_code ec;
    };
    struct Sent {
        std::vector<uint8_t> data;
        Ip4 addr;
        uint16_t port;
    };

    std::mutex mtx;
    std::condition_variable cv;
    std::deque<Inbound> inbox;
    std::vector<Sent> sent;
    uint16_t port = 0;
    int open_count = 0;
    int close_count = 0;
    bool interrupted = false;
    bool fail_open = false;
    bool fail_send = false;

    void push(const Ip4 &source, const Message &m) { push(source, encode_message(m)); }
    void push(const Ip4 &source, std::vector<uint8_t> data)
    {
        std::lock_guard<std::mutex> lk(mtx);
        inbox.push_back(Inbound{ Datagram{ source, DHCP_SERVER_PORT, std::move(data) }, {} });
        cv.notify_all();
    }
    void push_error(boost::system::error_code ec)
    {
        std::lock_guard<std::mutex> lk(mtx);
        inbox.push_back(Inbound{ Datagram{}, ec });
        cv.notify_all();
    }
    std::vector<Message> sent_messages()
    {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<Message> r;
        for (const auto &s: sent) {
            auto m = decode_message(s.data);
            if (m) r.push_back(std::move(*m));
        }
        return r;
    }
};

class FakeTransport final : public DatagramTransport
{
public:
    explicit FakeTransport(std::shared_ptr<FakeWire> wire) : wire_(std::move(wire)) {}

    void open(const Ip4 &, uint16_t port) override
    {
        std::lock_guard<std::mutex> lk(wire_->mtx);
        if (wire_->fail_open)
            throw BindError("port in use");
        wire_->port = port;
        ++wire_->open_count;
    }
    boost::system::error_code send_to(const std::vector<uint8_t> &buf,
                                      const Ip4 &addr, uint16_t port) override
    {
        std::lock_guard<std::mutex> lk(wire_->mtx);
        if (wire_->fail_send)
            return boost::asio::error::network_unreachable;
        wire_->sent.push_back(FakeWire::Sent{ buf, addr, port });
        return {};
    }
    boost::system::error_code receive(Datagram &out,
                                      std::chrono::milliseconds timeout) override
    {
        std::unique_lock<std::mutex> lk(wire_->mtx);
        wire_->cv.wait_for(lk, timeout, [this] {
            return wire_->interrupted || !wire_->inbox.empty();
        });
        if (wire_->interrupted)
            return boost::asio::error::operation_aborted;
        if (wire_->inbox.empty())
            return boost::asio::error::timed_out;
        auto in = std::move(wire_->inbox.front());
        wire_->inbox.pop_front();
        if (in.ec)
            return in.ec;
        out = std::move(in.dg);
        return {};
    }
    void interrupt() override
    {
        std::lock_guard<std::mutex> lk(wire_->mtx);
        wire_->interrupted = true;
        wire_->cv.notify_all();
    }
    void close() override
    {
        std::lock_guard<std::mutex> lk(wire_->mtx);
        ++wire_->close_count;
    }
private:
    std::shared_ptr<FakeWire> wire_;
};

}}

#endif
