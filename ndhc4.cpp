// Copyright 2014-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <getopt.h>
#include <limits.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <fmt/format.h>
#include "dhcpclient.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "transport.hpp"

#ifndef NDHC4_VERSION
#define NDHC4_VERSION "0.1"
#endif

using namespace ndhc4;

namespace {

enum class Action { Acquire, Decline, Release };

struct Options {
    ClientConfig cfg;
    Action action = Action::Acquire;
    std::string target;
    long count = 1;
};

}

template <typename... Args>
[[noreturn]] static void suicide(fmt::format_string<Args...> f, Args &&...args)
{
    log_line(f, std::forward<Args>(args)...);
    exit(EXIT_FAILURE);
}

static void usage()
{
    printf("ndhc4 " NDHC4_VERSION ", DHCPv4 client.\n");
    printf("Copyright 2014-2024 Nicholas J. Kain\n");
    printf("ndhc4 [options]...\n\nOptions:\n");
    printf("--server          -s []  Server address (default 255.255.255.255).\n");
    printf("--relay           -r []  Relay agent address; listen on port 67.\n");
    printf("--hostname        -n []  Host name to send in option 12.\n");
    printf("--mac             -m []  Client hardware address.\n");
    printf("--count           -c []  Number of exchanges to run.\n");
    printf("--timeout         -t []  Seconds to wait for each reply.\n");
    printf("--decline         -d []  Decline the given address.\n");
    printf("--release         -R []  Release the given address.\n");
    printf("--verbose         -V     Dump every message sent and received.\n");
    printf("--version         -v     Print version and exit.\n");
    printf("--help            -h     Print this help and exit.\n");
}

static void print_version()
{
    log_line("ndhc4 " NDHC4_VERSION ", DHCPv4 client.\n"
             "Copyright 2014-2024 Nicholas J. Kain\n\n"
"Permission is hereby granted, free of charge, to any person obtaining\n"
"a copy of this software and associated documentation files (the\n"
"\"Software\"), to deal in the Software without restriction, including\n"
"without limitation the rights to use, copy, modify, merge, publish,\n"
"distribute, sublicense, and/or sell copies of the Software, and to\n"
"permit persons to whom the Software is furnished to do so, subject to\n"
"the following conditions:\n\n"
"The above copyright notice and this permission notice shall be\n"
"included in all copies or substantial portions of the Software.\n\n"
"THE SOFTWARE IS PROVIDED \"AS IS\", WITHOUT WARRANTY OF ANY KIND,\n"
"EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF\n"
"MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND\n"
"NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE\n"
"LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION\n"
"OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION\n"
"WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.\n"
    );
}

static long parse_positive(const char *arg, const char *what)
{
    char *end;
    errno = 0;
    auto v = strtol(arg, &end, 10);
    if (errno || end == arg || *end || v <= 0 || v > INT_MAX)
        suicide("ndhc4: invalid {}: '{}'\n", what, arg);
    return v;
}

static Options process_options(int ac, char *av[])
{
    Options o;
    static struct option long_options[] = {
        {"server", 1, nullptr, 's'},
        {"relay", 1, nullptr, 'r'},
        {"hostname", 1, nullptr, 'n'},
        {"mac", 1, nullptr, 'm'},
        {"count", 1, nullptr, 'c'},
        {"timeout", 1, nullptr, 't'},
        {"decline", 1, nullptr, 'd'},
        {"release", 1, nullptr, 'R'},
        {"verbose", 0, nullptr, 'V'},
        {"version", 0, nullptr, 'v'},
        {"help", 0, nullptr, 'h'},
        {nullptr, 0, nullptr, 0 }
    };
    for (;;) {
        auto c = getopt_long(ac, av, "s:r:n:m:c:t:d:R:Vvh", long_options, nullptr);
        if (c == -1) break;
        switch (c) {
            case 's': o.cfg.server = optarg; break;
            case 'r': o.cfg.relay = optarg; break;
            case 'n': o.cfg.hostname = optarg; break;
            case 'm': o.cfg.mac = optarg; break;
            case 'c': o.count = parse_positive(optarg, "count"); break;
            case 't':
                o.cfg.timeout = std::chrono::seconds(parse_positive(optarg, "timeout"));
                break;
            case 'd': o.action = Action::Decline; o.target = optarg; break;
            case 'R': o.action = Action::Release; o.target = optarg; break;
            case 'V': o.cfg.verbose = true; break;
            case 'v': print_version(); exit(EXIT_SUCCESS); break;
            case 'h': usage(); exit(EXIT_SUCCESS); break;
            default: usage(); exit(EXIT_FAILURE); break;
        }
    }
    if (optind < ac)
        suicide("ndhc4: unexpected argument '{}'\n", av[optind]);
    return o;
}

static void print_lease(const Message &ack)
{
    fmt::print("address: {}\n", ip4_to_string(ack.yiaddr));
    if (auto o = find_option<ServerIdOption>(ack))
        fmt::print("server: {}\n", ip4_to_string(o->address));
    if (auto o = find_option<LeaseTimeOption>(ack))
        fmt::print("lease: {}s\n", o->seconds);
    if (auto o = find_option<SubnetMaskOption>(ack))
        fmt::print("subnet: {}\n", ip4_to_string(o->mask.data(), o->mask.size()));
    if (auto o = find_option<RouterOption>(ack)) {
        for (const auto &r: o->routers)
            fmt::print("router: {}\n", ip4_to_string(r));
    }
    if (auto o = find_option<DnsServerOption>(ack)) {
        for (const auto &s: o->servers)
            fmt::print("dns: {}\n", ip4_to_string(s));
    }
}

static std::unique_ptr<ClientSession> start_session(const Options &o, XidSource &xids)
{
    auto transport = std::make_unique<UdpTransport>();
    switch (o.action) {
    case Action::Decline:
        return ClientSession::decline(o.cfg, o.target, std::move(transport), xids);
    case Action::Release:
        return ClientSession::release(o.cfg, o.target, std::move(transport), xids);
    case Action::Acquire:
        break;
    }
    return ClientSession::acquire(o.cfg, std::move(transport), xids);
}

int main(int ac, char *av[])
{
    const auto o = process_options(ac, av);
    ClockXidSource xids;

    bool ok = true;
    for (long i = 0; i < o.count; ++i) {
        std::unique_ptr<ClientSession> session;
        try {
            session = start_session(o, xids);
        } catch (const ConfigError &e) {
            suicide("ndhc4: {}\n", e.what());
        } catch (const TransportError &e) {
            suicide("ndhc4: {}\n", e.what());
        }
        const auto r = session->wait();
        log_line("ndhc4: xid={:08x}: {}\n", session->xid(), outcome_name(r.outcome));
        switch (r.outcome) {
        case Outcome::Bound:
            if (o.action == Action::Acquire && r.reply)
                print_lease(*r.reply);
            break;
        case Outcome::Answered:
            break;
        case Outcome::NoResponse:
            // Servers are not required to answer a RELEASE.
            if (o.action != Action::Release)
                ok = false;
            break;
        case Outcome::Nak:
        case Outcome::TransportFailure:
        case Outcome::Cancelled:
            ok = false;
            break;
        }
    }
    exit(ok ? EXIT_SUCCESS : EXIT_FAILURE);
}
