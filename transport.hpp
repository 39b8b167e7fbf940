// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_TRANSPORT_HPP_
#define NDHC4_TRANSPORT_HPP_

#include <stdint.h>
#include <array>
#include <atomic>
#include <chrono>
#include <vector>
#include <boost/asio.hpp>
#include <boost/utility.hpp>
#include "dhcp.hpp"
#include "ipaddr.hpp"

namespace ndhc4 {

struct Datagram {
    Ip4 source{};
    uint16_t source_port = 0;
    std::vector<uint8_t> data;
};

// What a session needs from a UDP socket.  Implementations are used by a
// single session: open/send/receive/close are called from one thread at
// a time, interrupt() may be called from any thread.
class DatagramTransport
{
public:
    virtual ~DatagramTransport() {}
    // Throws BindError if the local port can't be bound.
    virtual void open(const Ip4 &local, uint16_t port) = 0;
    virtual boost::system::error_code send_to(const std::vector<uint8_t> &buf,
                                              const Ip4 &addr, uint16_t port) = 0;
    // boost::asio::error::timed_out if nothing arrived before the timeout,
    // boost::asio::error::operation_aborted after interrupt().
    virtual boost::system::error_code receive(Datagram &out,
                                              std::chrono::milliseconds timeout) = 0;
    // Makes a blocked or future receive() return promptly.
    virtual void interrupt() = 0;
    virtual void close() = 0;
};

class UdpTransport final : public DatagramTransport, boost::noncopyable
{
public:
    UdpTransport();
    ~UdpTransport() override;

    void open(const Ip4 &local, uint16_t port) override;
    boost::system::error_code send_to(const std::vector<uint8_t> &buf,
                                      const Ip4 &addr, uint16_t port) override;
    boost::system::error_code receive(Datagram &out,
                                      std::chrono::milliseconds timeout) override;
    void interrupt() override;
    void close() override;
    // Useful after binding port 0.
    uint16_t local_port() const;
private:
    boost::asio::io_service io_service_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint remote_endpoint_;
    std::array<uint8_t, DHCP_MAX_MSG_LEN> recv_buffer_;
    std::atomic<bool> interrupted_;
};

}

#endif
