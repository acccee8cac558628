/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/pow/stripe.hpp"

#include <limits>

#include "powex/crypto/difficulty.hpp"

namespace powex::pow {

StripeOutcome scan_stripe(crypto::PayloadHasher& hasher,
                          std::uint32_t difficulty,
                          const Stripe& stripe,
                          const std::atomic<bool>* stop) {
    constexpr std::uint64_t kLastNonce = std::numeric_limits<std::uint64_t>::max();

    StripeOutcome out;
    std::uint64_t nonce = stripe.first;

    while (out.hashes < stripe.max_attempts) {
        if (stop != nullptr && out.hashes % kStopCheckInterval == 0 &&
            stop->load(std::memory_order_acquire)) {
            break;
        }

        const auto digest = hasher.digest(nonce);
        ++out.hashes;
        if (crypto::meets_difficulty(digest, difficulty)) {
            out.nonce = nonce;
            break;
        }

        // End of the 64-bit space for this stripe
        if (nonce > kLastNonce - stripe.stride) {
            break;
        }
        nonce += stripe.stride;
    }
    return out;
}

} // namespace powex::pow
