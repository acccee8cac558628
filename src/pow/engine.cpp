/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/pow/engine.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

#include "powex/crypto/difficulty.hpp"
#include "powex/crypto/hex.hpp"
#include "powex/pow/parallel_searcher.hpp"
#include "powex/pow/sequential_searcher.hpp"
#include "powex/pow/validation.hpp"

namespace powex::pow {

namespace {

double elapsed_ms(const SearchStats& stats) {
    return std::chrono::duration<double, std::milli>(stats.elapsed).count();
}

} // namespace

Engine::Engine(logging::Logger& log, config::EngineConfig cfg)
    : log_(log)
    , cfg_(cfg) {}

SearchLimits Engine::limits() const {
    SearchLimits limits;
    limits.max_attempts = cfg_.max_attempts;
    limits.guard_difficulty = cfg_.guard_difficulty;
    return limits;
}

std::uint32_t Engine::default_threads() const {
    std::int64_t n = cfg_.threads;
    if (n == 0) {
        n = static_cast<std::int64_t>(std::thread::hardware_concurrency());
    }
    return static_cast<std::uint32_t>(std::clamp<std::int64_t>(n, kMinThreads, kMaxThreads));
}

Result<std::uint64_t> Engine::compute(const crypto::Payload& payload, std::int64_t difficulty,
                                      SearchStats* stats) const {
    log_.debug(fmt::format("compute: {} byte payload, difficulty {}", payload.size(), difficulty));
    SequentialSearcher searcher(log_, limits());
    try {
        auto result = searcher.search(payload, difficulty);
        if (stats) *stats = searcher.stats();
        if (result) {
            log_.debug(fmt::format("compute: nonce {} after {} hashes in {:.2f} ms",
                                   result.value(), searcher.stats().hashes, elapsed_ms(searcher.stats())));
        }
        return result;
    } catch (const std::runtime_error& e) {
        log_.error(fmt::format("compute failed: {}", e.what()));
        return Result<std::uint64_t>::failure(Error::Internal);
    }
}

bool Engine::valid(const crypto::Payload& payload, std::uint64_t nonce, std::int64_t difficulty) const noexcept {
    if (check_difficulty(difficulty)) {
        return false;
    }
    try {
        const auto digest = crypto::pow_digest(payload, nonce);
        return crypto::meets_difficulty(digest, static_cast<std::uint32_t>(difficulty));
    } catch (const std::exception& e) {
        log_.error(fmt::format("valid: hashing failed: {}", e.what()));
        return false;
    }
}

Result<std::uint64_t> Engine::compute_parallel(const crypto::Payload& payload, std::int64_t difficulty,
                                               std::int64_t thread_count, SearchStats* stats) const {
    log_.debug(fmt::format("compute_parallel: {} byte payload, difficulty {}, {} threads",
                           payload.size(), difficulty, thread_count));
    ParallelSearcher searcher(log_, limits());
    auto result = searcher.search(payload, difficulty, thread_count);
    if (stats) *stats = searcher.stats();
    if (result) {
        log_.debug(fmt::format("compute_parallel: nonce {} after {} hashes in {:.2f} ms",
                               result.value(), searcher.stats().hashes, elapsed_ms(searcher.stats())));
    }
    return result;
}

Result<std::string> Engine::get_hash(const crypto::Payload& payload, std::uint64_t nonce) const {
    try {
        return Result<std::string>::success(crypto::to_hex(crypto::pow_digest(payload, nonce)));
    } catch (const std::runtime_error& e) {
        log_.error(fmt::format("get_hash failed: {}", e.what()));
        return Result<std::string>::failure(Error::Internal);
    }
}

} // namespace powex::pow
