/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/pow/sequential_searcher.hpp"

#include <chrono>

#include <fmt/format.h>

#include "powex/pow/stripe.hpp"
#include "powex/pow/validation.hpp"

namespace powex {
namespace pow {

SequentialSearcher::SequentialSearcher(logging::Logger& log, SearchLimits limits)
    : log_(log)
    , limits_(limits) {}

Result<std::uint64_t> SequentialSearcher::search(const crypto::Payload& payload, std::int64_t difficulty) {
    stats_ = SearchStats{};
    if (auto err = check_difficulty(difficulty)) {
        return Result<std::uint64_t>::failure(*err);
    }

    const auto diff = static_cast<std::uint32_t>(difficulty);
    const Stripe stripe{0, 1, limits_.ceiling_for(diff)};

    auto start_time = std::chrono::steady_clock::now();
    crypto::PayloadHasher hasher(payload);
    const StripeOutcome outcome = scan_stripe(hasher, diff, stripe, nullptr);

    stats_.hashes = outcome.hashes;
    stats_.workers = 1;
    stats_.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (!outcome.nonce) {
        log_.warn(fmt::format("Sequential search gave up at difficulty {} after {} hashes",
                              diff, outcome.hashes));
        return Result<std::uint64_t>::failure(Error::Exhausted);
    }
    return Result<std::uint64_t>::success(*outcome.nonce);
}

} // namespace pow
} // namespace powex
