/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/pow/result.hpp"

namespace powex::pow {

std::string_view describe(Error error) {
    switch (error) {
        case Error::InvalidDifficulty:  return "Difficulty too high (max 64)";
        case Error::InvalidThreadCount: return "Invalid number of threads (1-64)";
        case Error::Exhausted:          return "No valid nonce found";
        case Error::Internal:           return "Internal hashing failure";
    }
    return "Unknown error";
}

} // namespace powex::pow
