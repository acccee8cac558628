#pragma once

#include <string>

#include <powex/config/types.hpp>
#include <powex/crypto/sha256.hpp>
#include <powex/logging/logger.hpp>

namespace powex::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
powex::config::ParseResult parse(int argc, char** argv, powex::logging::Logger& log);

// Resolve --data/--file/--hex into payload bytes. Fills 'err' on unreadable file or bad hex.
bool load_payload(const powex::config::PayloadSource& src, powex::crypto::Payload& out, std::string& err);

} // namespace powex::cli
