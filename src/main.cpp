/*
 * powex command line
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <cstdint>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <powex/cli/args.hpp>
#include <powex/config/loader.hpp>
#include <powex/log.hpp>
#include <powex/logging/fmt_logger.hpp>
#include <powex/pow/engine.hpp>
#include <powex/config/validator.hpp>

using powex::config::Command;
using powex::config::RunRequest;
using powex::pow::Engine;

namespace {

bool report_errors(powex::logging::Logger& log, const std::vector<std::string>& errs) {
    for (const auto& e : errs) log.error(e);
    return !errs.empty();
}

// Sequential when no thread option was given, parallel otherwise
powex::pow::Result<std::uint64_t> run_search(const Engine& engine, const RunRequest& req,
                                             const powex::crypto::Payload& payload,
                                             powex::pow::SearchStats& stats) {
    if (!req.parallel) {
        return engine.compute(payload, req.difficulty, &stats);
    }
    const std::int64_t threads = req.threads ? *req.threads : engine.default_threads();
    return engine.compute_parallel(payload, req.difficulty, threads, &stats);
}

int cmd_compute(const Engine& engine, const RunRequest& req, const powex::crypto::Payload& payload,
                powex::logging::Logger& log) {
    powex::pow::SearchStats stats;
    auto result = run_search(engine, req, payload, stats);
    if (!result) {
        log.error(std::string(result.reason()));
        return 1;
    }
    auto hash = engine.get_hash(payload, result.value());
    if (!hash) {
        log.error(std::string(hash.reason()));
        return 1;
    }
    fmt::print("nonce  : {}\n", result.value());
    fmt::print("hash   : {}\n", hash.value());
    log.debug(fmt::format("{} hashes on {} worker(s), {:.0f} H/s", stats.hashes, stats.workers, stats.hashrate()));
    return 0;
}

int cmd_verify(const Engine& engine, const RunRequest& req, const powex::crypto::Payload& payload,
               powex::logging::Logger& log) {
    std::uint64_t nonce = 0;
    std::string err;
    bool ok = false;
    if (powex::config::parse_u64(req.nonce, nonce, err)) {
        ok = engine.valid(payload, nonce, req.difficulty);
    } else {
        log.debug(fmt::format("nonce: {}", err));
    }
    fmt::print("{}\n", ok ? "valid" : "invalid");
    return ok ? 0 : 1;
}

int cmd_hash(const Engine& engine, const RunRequest& req, const powex::crypto::Payload& payload,
             powex::logging::Logger& log) {
    std::uint64_t nonce = 0;
    std::string err;
    if (!powex::config::parse_u64(req.nonce, nonce, err)) {
        log.error(fmt::format("nonce: {}", err));
        return 1;
    }
    auto hash = engine.get_hash(payload, nonce);
    if (!hash) {
        log.error(std::string(hash.reason()));
        return 1;
    }
    fmt::print("{}\n", hash.value());
    return 0;
}

int cmd_bench(const Engine& engine, const RunRequest& req, const powex::crypto::Payload& payload,
              powex::logging::Logger& log) {
    powex::log::line("powex benchmark: {} byte payload, difficulty {}", payload.size(), req.difficulty);

    powex::pow::SearchStats seq_stats;
    auto seq = engine.compute(payload, req.difficulty, &seq_stats);
    if (!seq) {
        log.error(fmt::format("sequential: {}", seq.reason()));
        return 1;
    }
    powex::log::line("sequential     : {:>10.2f} ms  {:>12.0f} H/s  nonce {}",
                     seq_stats.elapsed.count() / 1e6, seq_stats.hashrate(), seq.value());

    std::vector<std::int64_t> thread_counts;
    if (req.threads) thread_counts.push_back(*req.threads);
    else thread_counts = {1, 2, 4, 8};

    int rc = 0;
    for (auto threads : thread_counts) {
        powex::pow::SearchStats par_stats;
        auto par = engine.compute_parallel(payload, req.difficulty, threads, &par_stats);
        if (!par) {
            log.error(fmt::format("parallel x{}: {}", threads, par.reason()));
            rc = 1;
            continue;
        }
        const bool ok = engine.valid(payload, par.value(), req.difficulty);
        const double speedup = par_stats.elapsed.count() > 0
            ? static_cast<double>(seq_stats.elapsed.count()) / static_cast<double>(par_stats.elapsed.count())
            : 0.0;
        powex::log::line("parallel x{:<3}  : {:>10.2f} ms  {:>12.0f} H/s  nonce {}  speedup {:.2f}x{}",
                         threads, par_stats.elapsed.count() / 1e6, par_stats.hashrate(), par.value(),
                         speedup, ok ? "" : "  INVALID");
        if (!ok) rc = 1;
    }
    return rc;
}

} // namespace

int main(int argc, char** argv) {
    powex::logging::FmtLogger log;

    auto parsed = powex::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.request.has_value()) {
        return 1;
    }
    const auto& req = *parsed.request;

    // Config file, then environment, then CLI flags
    powex::config::EngineConfig cfg;
    if (report_errors(log, powex::config::load_from_file(cfg, parsed.config_path))) return 1;
    if (report_errors(log, powex::config::apply_env_overrides(cfg))) return 1;
    if (parsed.debug) cfg.debug = true;
    if (report_errors(log, powex::config::validate_final(cfg))) return 1;
    log.set_debug(cfg.debug);

    powex::crypto::Payload payload;
    std::string err;
    if (!powex::cli::load_payload(req.payload, payload, err)) {
        log.error(err);
        return 1;
    }

    Engine engine(log, cfg);
    log.debug(fmt::format("max_attempts={} guard_difficulty={} threads={}",
                          cfg.max_attempts, cfg.guard_difficulty, engine.default_threads()));

    switch (req.command) {
        case Command::Compute: return cmd_compute(engine, req, payload, log);
        case Command::Verify:  return cmd_verify(engine, req, payload, log);
        case Command::Hash:    return cmd_hash(engine, req, payload, log);
        case Command::Bench:   return cmd_bench(engine, req, payload, log);
    }
    return 1;
}
