// Copyright 2020-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <time.h>
#include "rng.hpp"

namespace ndhc4 {

uint32_t ClockXidSource::next_xid()
{
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    sfc64 prng(static_cast<uint64_t>(ts.tv_sec) * 1000000000u
               + static_cast<uint64_t>(ts.tv_nsec));
    return static_cast<uint32_t>(prng() >> 32);
}

uint32_t FixedXidSource::next_xid()
{
    if (ids_.empty()) return 0;
    auto r = ids_[idx_];
    idx_ = (idx_ + 1) % ids_.size();
    return r;
}

}
