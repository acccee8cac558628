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
 * Single-threaded brute-force search.
 *
 * Tests nonces 0, 1, 2, ... and returns the first one whose digest meets the
 * difficulty, which makes the result the smallest satisfying nonce. One
 * instance serves one search; stats() describes the last call.
 */
class SequentialSearcher {
public:
    explicit SequentialSearcher(logging::Logger& log, SearchLimits limits = {});

    // @throws std::runtime_error if the digest backend fails
    Result<std::uint64_t> search(const crypto::Payload& payload, std::int64_t difficulty);

    const SearchStats& stats() const { return stats_; }

private:
    logging::Logger& log_;
    SearchLimits limits_;
    SearchStats stats_;
};

} // namespace pow
} // namespace powex
