/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/pow/validation.hpp"

#include "powex/crypto/difficulty.hpp"

namespace powex::pow {

std::optional<Error> check_difficulty(std::int64_t difficulty) {
    if (difficulty < 0 || difficulty > static_cast<std::int64_t>(crypto::kMaxDifficulty)) {
        return Error::InvalidDifficulty;
    }
    return std::nullopt;
}

std::optional<Error> check_thread_count(std::int64_t thread_count) {
    if (thread_count < kMinThreads || thread_count > kMaxThreads) {
        return Error::InvalidThreadCount;
    }
    return std::nullopt;
}

std::optional<Error> check_parallel_params(std::int64_t difficulty, std::int64_t thread_count) {
    if (auto err = check_difficulty(difficulty)) return err;
    return check_thread_count(thread_count);
}

} // namespace powex::pow
