#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace powex::config {

// Engine tuning, loaded from powex.conf / POWEX_* env / CLI
struct EngineConfig {
    std::uint64_t max_attempts{100'000'000}; // per-worker ceiling above guard_difficulty
    std::uint32_t guard_difficulty{20};
    std::uint32_t threads{0};                // 0 = hardware concurrency
    bool debug{false};
};

enum class Command {
    Compute,
    Verify,
    Hash,
    Bench,
};

// Where the payload bytes come from on the command line
struct PayloadSource {
    std::string data;
    std::string file;   // takes precedence over data when set
    bool hex{false};    // data (or file contents) is hex text
};

struct RunRequest {
    Command command{Command::Compute};
    PayloadSource payload;
    std::int64_t difficulty{0};
    std::string nonce;                   // kept as text; parsed by the command
    std::optional<std::int64_t> threads; // set by -t/--threads
    bool parallel{false};
};

struct ParseResult {
    std::optional<RunRequest> request; // present when valid and ready to run
    std::string config_path{"powex.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace powex::config
