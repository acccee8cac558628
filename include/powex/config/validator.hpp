#pragma once

#include <cstdint>
#include <string>

namespace powex::config {

// Parses a decimal unsigned 64-bit value (no sign, no spaces). Fills 'err' on failure.
bool parse_u64(const std::string& text, std::uint64_t& out, std::string& err);

// Parses a decimal value and checks it lies in [lo, hi].
bool parse_in_range(const std::string& text, std::uint64_t lo, std::uint64_t hi,
                    std::uint64_t& out, std::string& err);

// Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
bool parse_bool(const std::string& text, bool& out, std::string& err);

} // namespace powex::config
