/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

#include <powex/crypto/sha256.hpp>

namespace powex::pow {

// Nonces first, first + stride, first + 2*stride, ... capped at max_attempts
struct Stripe {
    std::uint64_t first{0};
    std::uint64_t stride{1};
    std::uint64_t max_attempts{0};
};

struct StripeOutcome {
    std::optional<std::uint64_t> nonce;
    std::uint64_t hashes{0};
};

// How many nonces a worker tests between two looks at the stop flag
constexpr std::uint64_t kStopCheckInterval = 64;

/**
 * Inner search loop shared by the sequential and parallel searchers.
 *
 * Returns the first nonce of the stripe meeting 'difficulty', or an empty
 * nonce when the stripe ceiling, the end of the 64-bit space or the stop
 * flag is reached. 'stop' may be null for a single-threaded scan.
 *
 * @throws std::runtime_error if the digest backend fails
 */
StripeOutcome scan_stripe(crypto::PayloadHasher& hasher,
                          std::uint32_t difficulty,
                          const Stripe& stripe,
                          const std::atomic<bool>* stop);

} // namespace powex::pow
