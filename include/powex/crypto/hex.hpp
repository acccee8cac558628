/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <powex/crypto/sha256.hpp>

namespace powex::crypto {

// Lowercase hex helpers
std::string bytes_to_hex(const std::uint8_t* data, std::size_t len);
std::string to_hex(const Sha256Digest& digest);

// Decodes hex (either case). Returns false and fills 'err' on odd length or bad characters.
bool hex_to_bytes(std::string_view hex, std::vector<std::uint8_t>& out, std::string& err);

} // namespace powex::crypto
