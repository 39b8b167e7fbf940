// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_ERRORS_HPP_
#define NDHC4_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ndhc4 {

// Bad MAC or IP text handed to a session factory.
struct ConfigError : public std::runtime_error
{
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

struct TransportError : public std::runtime_error
{
    explicit TransportError(const std::string &what) : std::runtime_error(what) {}
};

struct BindError : public TransportError
{
    explicit BindError(const std::string &what) : TransportError(what) {}
};

}

#endif
