/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>

#include <powex/pow/result.hpp>

namespace powex::pow {

constexpr std::int64_t kMinThreads = 1;
constexpr std::int64_t kMaxThreads = 64;

// Parameter checks shared by both searchers. Signed inputs so that negative
// values coming from the CLI or config are rejected instead of wrapping.
std::optional<Error> check_difficulty(std::int64_t difficulty);
std::optional<Error> check_thread_count(std::int64_t thread_count);

// Difficulty is checked before thread count
std::optional<Error> check_parallel_params(std::int64_t difficulty, std::int64_t thread_count);

} // namespace powex::pow
