/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>

#include <powex/crypto/sha256.hpp>

namespace powex::crypto {

// Digest hex is 64 characters, so at most 64 leading zero nibbles
constexpr std::uint32_t kMaxDifficulty = 64;

// Number of leading zero hex characters of the digest (0..64)
std::uint32_t leading_zero_nibbles(const Sha256Digest& digest);

// True if the first 'difficulty' hex characters of the digest are '0'.
// Difficulty 0 always passes; anything above 64 never does.
bool meets_difficulty(const Sha256Digest& digest, std::uint32_t difficulty);

} // namespace powex::crypto
