// Copyright 2020-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef NDHC4_RNG_HPP_
#define NDHC4_RNG_HPP_

#include <cstdint>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace ndhc4 {

namespace detail {
    static constexpr inline uint64_t rotl(const uint64_t x, int k) noexcept {
        return (x << k) | (x >> (64 - k));
    }
}

// Small fast chaotic generator; only used for transaction ids.
struct sfc64 final
{
    typedef std::uint64_t result_type;
    constexpr sfc64(uint64_t a) : s_{ a, a, a, 1 } { discard(12); }
    constexpr inline uint64_t operator()()
    {
        const auto t = s_[0] + s_[1] + s_[3]++;
        s_[0] = s_[1] ^ (s_[1] >> 11);
        s_[1] = s_[2] + (s_[2] << 3);
        s_[2] = detail::rotl(s_[2], 24) + t;
        return t;
    }
    constexpr void discard(size_t z) { while (z-- > 0) operator()(); }
    static constexpr uint64_t min() { return std::numeric_limits<uint64_t>::min(); }
    static constexpr uint64_t max() { return std::numeric_limits<uint64_t>::max(); }
private:
    uint64_t s_[4];
};

// Source of DHCP transaction ids.  Handed to a session at construction
// so that callers (and tests) decide where the randomness comes from.
class XidSource
{
public:
    virtual ~XidSource() {}
    virtual uint32_t next_xid() = 0;
};

// Reseeds from the wall clock on every call.
class ClockXidSource final : public XidSource
{
public:
    uint32_t next_xid() override;
};

// Replays a fixed list of ids, wrapping around at the end.
class FixedXidSource final : public XidSource
{
public:
    explicit FixedXidSource(std::vector<uint32_t> ids) : ids_(std::move(ids)), idx_(0) {}
    uint32_t next_xid() override;
private:
    std::vector<uint32_t> ids_;
    size_t idx_;
};

}

#endif
