/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/crypto/difficulty.hpp"

namespace powex {
namespace crypto {

std::uint32_t leading_zero_nibbles(const Sha256Digest& digest) {
    std::uint32_t count = 0;
    for (std::uint8_t byte : digest.bytes) {
        if (byte == 0) {
            count += 2;
            continue;
        }
        // High nibble is printed first in the hex form
        if ((byte & 0xF0) == 0) {
            count += 1;
        }
        break;
    }
    return count;
}

bool meets_difficulty(const Sha256Digest& digest, std::uint32_t difficulty) {
    if (difficulty == 0) {
        return true;
    }
    if (difficulty > kMaxDifficulty) {
        return false;
    }

    // Whole zero bytes first, then an optional zero high nibble
    const std::uint32_t full_bytes = difficulty / 2;
    for (std::uint32_t i = 0; i < full_bytes; ++i) {
        if (digest.bytes[i] != 0) {
            return false;
        }
    }
    if (difficulty % 2 != 0 && (digest.bytes[full_bytes] & 0xF0) != 0) {
        return false;
    }
    return true;
}

} // namespace crypto
} // namespace powex
