/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>

#include <powex/crypto/sha256.hpp>
#include <powex/logging/logger.hpp>
#include <powex/pow/result.hpp>
#include <powex/pow/search_types.hpp>

namespace powex {
namespace pow {

/**
 * Multi-threaded search over striped partitions of the nonce space.
 *
 * Worker i of N tests i, i+N, i+2N, ... The first worker to find a nonce
 * claims a shared flag by compare-and-set and is the only one to write the
 * result; the others see the flag within kStopCheckInterval nonces and
 * return. Every worker is joined before search() returns.
 *
 * With more than one thread the returned nonce is whichever one was claimed
 * first, not necessarily the smallest. With one thread the stripe is the
 * whole space and the result equals SequentialSearcher's.
 *
 * SearchLimits::max_attempts applies per worker.
 */
class ParallelSearcher {
public:
    explicit ParallelSearcher(logging::Logger& log, SearchLimits limits = {});

    Result<std::uint64_t> search(const crypto::Payload& payload,
                                 std::int64_t difficulty,
                                 std::int64_t thread_count);

    const SearchStats& stats() const { return stats_; }

private:
    logging::Logger& log_;
    SearchLimits limits_;
    SearchStats stats_;
};

} // namespace pow
} // namespace powex
