#pragma once

#include <string>
#include <vector>

#include <powex/config/types.hpp>

namespace powex::config {

// Read configuration from file (JSON or key=value). Missing file is not an error.
// Returns list of validation errors (empty if ok); cfg is left untouched on error.
std::vector<std::string> load_from_file(EngineConfig& cfg, const std::string& path);

// Apply POWEX_* environment variables (MAX_ATTEMPTS, GUARD_DIFFICULTY, THREADS, DEBUG) on top of cfg.
std::vector<std::string> apply_env_overrides(EngineConfig& cfg);

// Validate final config ranges. Returns list of errors.
std::vector<std::string> validate_final(const EngineConfig& cfg);

} // namespace powex::config
