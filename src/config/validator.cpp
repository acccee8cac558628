#include <powex/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/core.h>

namespace powex::config {

bool parse_u64(const std::string& text, std::uint64_t& out, std::string& err) {
    if (text.empty()) { err = "empty value"; return false; }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = fmt::format("'{}' is not an unsigned decimal number", text); return false; }
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char c : text) {
        auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            err = fmt::format("'{}' does not fit in 64 bits", text); return false; }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

bool parse_in_range(const std::string& text, std::uint64_t lo, std::uint64_t hi,
                    std::uint64_t& out, std::string& err) {
    std::uint64_t value = 0;
    if (!parse_u64(text, value, err)) return false;
    if (value < lo || value > hi) {
        err = fmt::format("{} out of range ({}-{})", value, lo, hi); return false; }
    out = value;
    return true;
}

bool parse_bool(const std::string& text, bool& out, std::string& err) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
    err = fmt::format("'{}' is not a boolean", text);
    return false;
}

} // namespace powex::config
