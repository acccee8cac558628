/*
 * Unit tests for the engine operations: compute, valid, compute_parallel, get_hash
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powex/logging/fmt_logger.hpp>
#include <powex/pow/engine.hpp>

using namespace powex;
using powex::crypto::to_payload;

namespace {

bool starts_with_zeros(const std::string& hex, std::int64_t n) {
    return hex.compare(0, static_cast<std::size_t>(n), std::string(static_cast<std::size_t>(n), '0')) == 0;
}

} // namespace

TEST_SUITE("Engine") {
    TEST_CASE("compute - difficulty 0 gives nonce 0 and any nonce is valid") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        for (const char* data : {"", "test data", "any data"}) {
            CAPTURE(data);
            auto r = engine.compute(to_payload(data), 0);
            REQUIRE(r.ok());
            CHECK(r.value() == 0);
        }
        CHECK(engine.valid(to_payload("any data"), 12345, 0));
        CHECK(engine.valid(crypto::Payload{}, 0, 0));
    }

    TEST_CASE("compute - empty payload, difficulty 1") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        auto r = engine.compute(crypto::Payload{}, 1);
        REQUIRE(r.ok());
        CHECK(r.value() == 20);
        CHECK(engine.valid(crypto::Payload{}, r.value(), 1));
        auto hash = engine.get_hash(crypto::Payload{}, r.value());
        REQUIRE(hash.ok());
        CHECK(hash.value().front() == '0');
    }

    TEST_CASE("compute - difficulty 65 is rejected") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        auto r = engine.compute(to_payload("test"), 65);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error() == pow::Error::InvalidDifficulty);
        CHECK(r.reason() == "Difficulty too high (max 64)");
    }

    TEST_CASE("compute - stats are reported when requested") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        pow::SearchStats stats;
        auto r = engine.compute(to_payload("hello world"), 2, &stats);
        REQUIRE(r.ok());
        CHECK(stats.hashes == 348);
        CHECK(stats.workers == 1);
    }

    TEST_CASE("compute - forced ceiling gives Exhausted") {
        logging::FmtLogger log;
        config::EngineConfig cfg;
        cfg.max_attempts = 256;
        cfg.guard_difficulty = 0;
        pow::Engine engine(log, cfg);
        auto r = engine.compute(to_payload("test"), 64);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error() == pow::Error::Exhausted);

        auto p = engine.compute_parallel(to_payload("test"), 64, 4);
        REQUIRE_FALSE(p.ok());
        CHECK(p.error() == pow::Error::Exhausted);
    }

    TEST_CASE("valid - rejects the wrong nonce and bad difficulty") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        const auto payload = to_payload("test validation");
        auto r = engine.compute(payload, 3);
        REQUIRE(r.ok());
        CHECK(engine.valid(payload, r.value(), 3));
        CHECK_FALSE(engine.valid(payload, r.value() + 1, 3));
        CHECK_FALSE(engine.valid(payload, r.value(), 65));
        CHECK_FALSE(engine.valid(payload, r.value(), -1));
        // "test" with nonce 1 hashes to 0de0..., one zero only
        CHECK_FALSE(engine.valid(to_payload("test"), 1, 10));
        CHECK(engine.valid(to_payload("test"), 1, 1));
    }

    TEST_CASE("valid - equivalent to the get_hash prefix") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        for (const char* data : {"", "a", "hello world", "\x01\x02\x03"}) {
            const auto payload = to_payload(data);
            for (std::uint64_t nonce = 0; nonce < 300; ++nonce) {
                auto hash = engine.get_hash(payload, nonce);
                REQUIRE(hash.ok());
                for (std::int64_t d = 0; d <= 3; ++d) {
                    CAPTURE(nonce);
                    CAPTURE(d);
                    CHECK(engine.valid(payload, nonce, d) == starts_with_zeros(hash.value(), d));
                }
            }
        }
    }

    TEST_CASE("get_hash - known vector, lowercase, repeatable") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        auto h1 = engine.get_hash(to_payload("test data"), 12345);
        auto h2 = engine.get_hash(to_payload("test data"), 12345);
        REQUIRE(h1.ok());
        REQUIRE(h2.ok());
        CHECK(h1.value() == "b089249dceee6239f926e601e74f2f005ed18e0ac67ff54705acd081b477a3ab");
        CHECK(h1.value() == h2.value());
        CHECK(h1.value().size() == 64);
        CHECK(h1.value().find_first_not_of("0123456789abcdef") == std::string::npos);
    }

    TEST_CASE("get_hash - different inputs give different hashes") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        CHECK(engine.get_hash(to_payload("data1"), 555).value() !=
              engine.get_hash(to_payload("data2"), 555).value());
        CHECK(engine.get_hash(to_payload("data1"), 555).value() !=
              engine.get_hash(to_payload("data1"), 556).value());
        CHECK(engine.get_hash(crypto::Payload{1, 2, 3}, 777).value().size() == 64);
    }

    TEST_CASE("compute_parallel - valid result, single thread matches compute") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        const auto payload = to_payload("comparison test");

        auto seq = engine.compute(payload, 2);
        auto one = engine.compute_parallel(payload, 2, 1);
        auto many = engine.compute_parallel(payload, 2, 4);
        REQUIRE(seq.ok());
        REQUIRE(one.ok());
        REQUIRE(many.ok());
        CHECK(seq.value() == 777);
        CHECK(one.value() == seq.value());
        CHECK(engine.valid(payload, many.value(), 2));
    }

    TEST_CASE("compute_parallel - parameter errors") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        CHECK(engine.compute_parallel(to_payload("test"), 65, 4).error() == pow::Error::InvalidDifficulty);
        CHECK(engine.compute_parallel(to_payload("test"), 2, 0).error() == pow::Error::InvalidThreadCount);
        CHECK(engine.compute_parallel(to_payload("test"), 2, 65).error() == pow::Error::InvalidThreadCount);
        CHECK(engine.compute_parallel(to_payload("test"), 2, 100).reason() == "Invalid number of threads (1-64)");
    }

    TEST_CASE("default_threads - configured or clamped hardware concurrency") {
        logging::FmtLogger log;
        config::EngineConfig cfg;
        cfg.threads = 6;
        CHECK(pow::Engine(log, cfg).default_threads() == 6);

        cfg.threads = 0;
        auto n = pow::Engine(log, cfg).default_threads();
        CHECK(n >= 1);
        CHECK(n <= 64);
    }

    TEST_CASE("full workflow: compute, valid, get_hash") {
        logging::FmtLogger log;
        pow::Engine engine(log);
        const auto payload = to_payload("integration test data");
        auto r = engine.compute(payload, 3);
        REQUIRE(r.ok());
        CHECK(r.value() == 3160);
        CHECK(engine.valid(payload, r.value(), 3));
        CHECK_FALSE(engine.valid(payload, r.value() + 1, 3));
        auto hash = engine.get_hash(payload, r.value());
        REQUIRE(hash.ok());
        CHECK(starts_with_zeros(hash.value(), 3));
    }
}
