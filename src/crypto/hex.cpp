/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/crypto/hex.hpp"

#include <fmt/core.h>

namespace powex::crypto {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int nibble_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string bytes_to_hex(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const Sha256Digest& digest) {
    return bytes_to_hex(digest.bytes.data(), digest.bytes.size());
}

bool hex_to_bytes(std::string_view hex, std::vector<std::uint8_t>& out, std::string& err) {
    if (hex.size() % 2 != 0) {
        err = fmt::format("hex string has odd length ({})", hex.size());
        return false;
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble_value(hex[i]);
        int lo = nibble_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            err = fmt::format("invalid hex character at offset {}", hi < 0 ? i : i + 1);
            return false;
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

} // namespace powex::crypto
