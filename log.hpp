// Copyright 2003-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_LOG_HPP_
#define NDHC4_LOG_HPP_

#include <cstdio>
#include <utility>
#include <fmt/format.h>

namespace ndhc4 {

template <typename... Args>
static inline void log_line(fmt::format_string<Args...> f, Args &&...args)
{
    fmt::print(stderr, f, std::forward<Args>(args)...);
    std::fflush(stderr);
}

}

#endif
