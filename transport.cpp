// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <fmt/format.h>
#include "transport.hpp"
#include "errors.hpp"

namespace ba = boost::asio;

namespace ndhc4 {

UdpTransport::UdpTransport()
 : socket_(io_service_), interrupted_(false)
{
}

UdpTransport::~UdpTransport()
{
    close();
}

void UdpTransport::open(const Ip4 &local, uint16_t port)
{
    const ba::ip::udp::endpoint endpoint(ba::ip::address_v4(local), port);
    boost::system::error_code ec;
    socket_.open(endpoint.protocol(), ec);
    if (!ec) socket_.set_option(ba::ip::udp::socket::broadcast(true), ec);
    if (!ec) socket_.set_option(ba::ip::udp::socket::reuse_address(true), ec);
    if (!ec) socket_.bind(endpoint, ec);
    if (ec) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw BindError(fmt::format("failed to bind UDP {}:{}: {}",
                                    ip4_to_string(local), port, ec.message()));
    }
}

boost::system::error_code UdpTransport::send_to(const std::vector<uint8_t> &buf,
                                                const Ip4 &addr, uint16_t port)
{
    boost::system::error_code ec;
    socket_.send_to(ba::buffer(buf), ba::ip::udp::endpoint(ba::ip::address_v4(addr), port),
                    0, ec);
    return ec;
}

boost::system::error_code UdpTransport::receive(Datagram &out,
                                                std::chrono::milliseconds timeout)
{
    if (interrupted_)
        return ba::error::operation_aborted;

    boost::system::error_code ec = ba::error::would_block;
    std::size_t bytes_xferred = 0;
    socket_.async_receive_from
        (ba::buffer(recv_buffer_), remote_endpoint_,
         [&ec, &bytes_xferred](const boost::system::error_code &error,
                               std::size_t n)
         {
             ec = error;
             bytes_xferred = n;
         });

    io_service_.restart();
    if (!interrupted_)
        io_service_.run_for(timeout);
    if (ec == ba::error::would_block) {
        // Deadline passed or interrupt() stopped the loop; reap the
        // cancelled operation before reporting.
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        io_service_.restart();
        io_service_.run();
        if (interrupted_)
            return ba::error::operation_aborted;
        if (ec == ba::error::operation_aborted || ec == ba::error::would_block)
            return ba::error::timed_out;
    }
    if (ec)
        return ec;

    out.source = remote_endpoint_.address().to_v4().to_bytes();
    out.source_port = remote_endpoint_.port();
    out.data.assign(recv_buffer_.begin(), recv_buffer_.begin() + bytes_xferred);
    return ec;
}

void UdpTransport::interrupt()
{
    interrupted_ = true;
    io_service_.stop();
}

uint16_t UdpTransport::local_port() const
{
    boost::system::error_code ec;
    auto ep = socket_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void UdpTransport::close()
{
    if (!socket_.is_open())
        return;
    boost::system::error_code ignored;
    socket_.close(ignored);
}

}
