/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace powex::pow {

constexpr std::uint64_t kUnboundedAttempts = std::numeric_limits<std::uint64_t>::max();

/**
 * Internal safety valve for a search.
 *
 * When the requested difficulty is strictly greater than guard_difficulty,
 * each worker gives up after max_attempts nonces and the search reports
 * Error::Exhausted. At or below the guard the search runs until it finds a
 * nonce or the 64-bit nonce space ends.
 */
struct SearchLimits {
    std::uint64_t max_attempts{100'000'000};
    std::uint32_t guard_difficulty{20};

    std::uint64_t ceiling_for(std::uint32_t difficulty) const {
        return difficulty > guard_difficulty ? max_attempts : kUnboundedAttempts;
    }
};

struct SearchStats {
    std::uint64_t hashes{0};
    std::uint32_t workers{0};
    std::chrono::nanoseconds elapsed{0};

    double hashrate() const {
        const double secs = std::chrono::duration<double>(elapsed).count();
        return secs > 0.0 ? static_cast<double>(hashes) / secs : 0.0;
    }
};

} // namespace powex::pow
