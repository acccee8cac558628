#include <powex/cli/args.hpp>

#include <fstream>
#include <sstream>
#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <powex/crypto/hex.hpp>

#ifndef POWEX_VERSION
#define POWEX_VERSION "0.0.0"
#endif

namespace powex::cli {

namespace {

bool parse_command(const std::string& name, powex::config::Command& out) {
    using powex::config::Command;
    if (name == "compute") { out = Command::Compute; return true; }
    if (name == "verify")  { out = Command::Verify;  return true; }
    if (name == "hash")    { out = Command::Hash;    return true; }
    if (name == "bench")   { out = Command::Bench;   return true; }
    return false;
}

} // namespace

powex::config::ParseResult parse(int argc, char** argv, powex::logging::Logger& log) {
    using powex::config::Command;

    powex::config::ParseResult pr;
    cxxopts::Options options("powex", "SHA-256 Proof-of-Work nonce search");
    options.positional_help("<compute|verify|hash|bench>");
    options.add_options()
        ("command",      "compute, verify, hash or bench", cxxopts::value<std::string>())
        ("data",         "Payload text", cxxopts::value<std::string>()->default_value(""))
        ("file",         "Read payload bytes from file", cxxopts::value<std::string>())
        ("x,hex",        "Payload (--data or --file) is hex encoded")
        ("D,difficulty", "Leading zero hex characters (0-64)", cxxopts::value<std::int64_t>())
        ("n,nonce",      "Nonce to verify or hash", cxxopts::value<std::string>())
        ("t,threads",    "Worker threads (1-64); implies parallel search", cxxopts::value<std::int64_t>())
        ("p,parallel",   "Parallel search with the configured thread count")
        ("config",       "Path to config file (powex.conf)", cxxopts::value<std::string>()->default_value("powex.conf"))
        ("d,debug",      "Enable debug logging")
        ("v,version",    "Show version and exit")
        ("h,help",       "Show help and exit");
    options.parse_positional({"command"});

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("powex v{}", POWEX_VERSION));
            pr.show_only = true;
            return pr;
        }
        if (!result.count("command")) {
            log.error(fmt::format("Missing command\n\n{}", options.help()));
            return pr;
        }

        powex::config::RunRequest req;
        const auto command = result["command"].as<std::string>();
        if (!parse_command(command, req.command)) {
            log.error(fmt::format("Unknown command '{}'\n\n{}", command, options.help()));
            return pr;
        }

        req.payload.data = result["data"].as<std::string>();
        if (result.count("file")) req.payload.file = result["file"].as<std::string>();
        req.payload.hex = result.count("hex") > 0;

        if (result.count("difficulty")) {
            req.difficulty = result["difficulty"].as<std::int64_t>();
        } else if (req.command == Command::Bench) {
            req.difficulty = 4;
        } else if (req.command != Command::Hash) {
            log.error(fmt::format("'{}' requires --difficulty\n\n{}", command, options.help()));
            return pr;
        }

        if (result.count("nonce")) {
            req.nonce = result["nonce"].as<std::string>();
        } else if (req.command == Command::Verify || req.command == Command::Hash) {
            log.error(fmt::format("'{}' requires --nonce\n\n{}", command, options.help()));
            return pr;
        }

        if (result.count("threads")) req.threads = result["threads"].as<std::int64_t>();
        req.parallel = result.count("parallel") > 0 || req.threads.has_value();

        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.request = req;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

bool load_payload(const powex::config::PayloadSource& src, powex::crypto::Payload& out, std::string& err) {
    std::string text = src.data;
    if (!src.file.empty()) {
        std::ifstream in(src.file, std::ios::binary);
        if (!in.good()) {
            err = fmt::format("cannot open payload file '{}'", src.file);
            return false;
        }
        std::ostringstream buffer; buffer << in.rdbuf();
        text = buffer.str();
        if (src.hex) {
            // Hex files usually end with a newline
            auto end = text.find_last_not_of(" \t\r\n");
            text.erase(end == std::string::npos ? 0 : end + 1);
        }
    }
    if (src.hex) {
        return powex::crypto::hex_to_bytes(text, out, err);
    }
    out.assign(text.begin(), text.end());
    return true;
}

} // namespace powex::cli
