#include <powex/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <powex/config/validator.hpp>

namespace powex::config {

namespace {

constexpr std::uint64_t kMaxU64 = std::numeric_limits<std::uint64_t>::max();

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// Applies one textual setting; shared by key=value files and environment overrides
void apply_setting(EngineConfig& cfg, const std::string& key, const std::string& val,
                   std::vector<std::string>& errs) {
    std::string e;
    std::uint64_t n = 0;
    if (key == "max_attempts") {
        if (parse_in_range(val, 1, kMaxU64, n, e)) cfg.max_attempts = n;
        else errs.push_back(fmt::format("max_attempts: {}", e));
    } else if (key == "guard_difficulty") {
        if (parse_in_range(val, 0, 64, n, e)) cfg.guard_difficulty = static_cast<std::uint32_t>(n);
        else errs.push_back(fmt::format("guard_difficulty: {}", e));
    } else if (key == "threads") {
        if (parse_in_range(val, 0, 64, n, e)) cfg.threads = static_cast<std::uint32_t>(n);
        else errs.push_back(fmt::format("threads: {}", e));
    } else if (key == "debug") {
        bool b = false;
        if (parse_bool(val, b, e)) cfg.debug = b;
        else errs.push_back(fmt::format("debug: {}", e));
    }
}

void load_key_value(EngineConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        apply_setting(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)), errs);
    }
}

void load_json(EngineConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    nlohmann::json j = nlohmann::json::parse(text);
    if (!j.is_object()) {
        errs.push_back("config root must be a JSON object");
        return;
    }
    auto read_uint = [&](const char* key, std::uint64_t lo, std::uint64_t hi, auto&& assign) {
        if (!j.contains(key)) return;
        const auto& v = j.at(key);
        if (!v.is_number_unsigned()) {
            errs.push_back(fmt::format("'{}' must be a non-negative integer", key));
            return;
        }
        auto n = v.get<std::uint64_t>();
        if (n < lo || n > hi) {
            errs.push_back(fmt::format("'{}' out of range ({}-{})", key, lo, hi));
            return;
        }
        assign(n);
    };
    read_uint("max_attempts", 1, kMaxU64, [&](std::uint64_t n) { cfg.max_attempts = n; });
    read_uint("guard_difficulty", 0, 64, [&](std::uint64_t n) { cfg.guard_difficulty = static_cast<std::uint32_t>(n); });
    read_uint("threads", 0, 64, [&](std::uint64_t n) { cfg.threads = static_cast<std::uint32_t>(n); });
    if (j.contains("debug")) {
        if (j.at("debug").is_boolean()) cfg.debug = j.at("debug").get<bool>();
        else errs.push_back("'debug' must be a boolean");
    }
}

} // namespace

std::vector<std::string> load_from_file(EngineConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    EngineConfig staged = cfg;
    if (text[first_non_space] == '{') {
        try {
            load_json(staged, text, errs);
        } catch (const nlohmann::json::exception& ex) {
            errs.push_back(fmt::format("Failed to read {}: {}", path, ex.what()));
        }
    } else {
        load_key_value(staged, text, errs);
    }
    if (errs.empty()) cfg = staged;
    return errs;
}

std::vector<std::string> apply_env_overrides(EngineConfig& cfg) {
    std::vector<std::string> errs;
    EngineConfig staged = cfg;
    if (const char* v = std::getenv("POWEX_MAX_ATTEMPTS"))     apply_setting(staged, "max_attempts", v, errs);
    if (const char* v = std::getenv("POWEX_GUARD_DIFFICULTY")) apply_setting(staged, "guard_difficulty", v, errs);
    if (const char* v = std::getenv("POWEX_THREADS"))          apply_setting(staged, "threads", v, errs);
    if (const char* v = std::getenv("POWEX_DEBUG"))            apply_setting(staged, "debug", v, errs);
    for (auto& e : errs) e = fmt::format("environment {}", e);
    if (errs.empty()) cfg = staged;
    return errs;
}

std::vector<std::string> validate_final(const EngineConfig& cfg) {
    std::vector<std::string> errs;
    if (cfg.max_attempts == 0) errs.push_back("max_attempts must be at least 1");
    if (cfg.guard_difficulty > 64) errs.push_back("guard_difficulty must be in 0-64");
    if (cfg.threads > 64) errs.push_back("threads must be 0 (auto) or 1-64");
    return errs;
}

} // namespace powex::config
