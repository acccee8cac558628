/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>

#include <powex/config/types.hpp>
#include <powex/crypto/sha256.hpp>
#include <powex/logging/logger.hpp>
#include <powex/pow/result.hpp>
#include <powex/pow/search_types.hpp>

namespace powex::pow {

/**
 * Entry point for callers: compute, valid, compute_parallel and get_hash.
 *
 * Each call builds its own searcher, so no state is shared between calls.
 * Nothing is thrown; failures come back as a typed Error.
 */
class Engine {
public:
    explicit Engine(logging::Logger& log, config::EngineConfig cfg = {});

    // Smallest nonce meeting the difficulty
    Result<std::uint64_t> compute(const crypto::Payload& payload, std::int64_t difficulty,
                                  SearchStats* stats = nullptr) const;

    // True iff get_hash(payload, nonce) starts with 'difficulty' zeros.
    // Out-of-range difficulty yields false.
    bool valid(const crypto::Payload& payload, std::uint64_t nonce, std::int64_t difficulty) const noexcept;

    // Some nonce meeting the difficulty, searched on thread_count workers
    Result<std::uint64_t> compute_parallel(const crypto::Payload& payload, std::int64_t difficulty,
                                           std::int64_t thread_count,
                                           SearchStats* stats = nullptr) const;

    // 64-character lowercase hex of SHA-256(payload || nonce)
    Result<std::string> get_hash(const crypto::Payload& payload, std::uint64_t nonce) const;

    // Configured thread count, or hardware concurrency clamped to [1, 64]
    std::uint32_t default_threads() const;

    SearchLimits limits() const;

private:
    logging::Logger& log_;
    config::EngineConfig cfg_;
};

} // namespace powex::pow
