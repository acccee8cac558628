/*
 * Unit tests for search parameter validation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powex/pow/validation.hpp>

using namespace powex::pow;

TEST_SUITE("Validation") {
    TEST_CASE("check_difficulty - accepts 0..64") {
        CHECK_FALSE(check_difficulty(0).has_value());
        CHECK_FALSE(check_difficulty(20).has_value());
        CHECK_FALSE(check_difficulty(64).has_value());
    }

    TEST_CASE("check_difficulty - rejects out of range") {
        CHECK(check_difficulty(65) == Error::InvalidDifficulty);
        CHECK(check_difficulty(-1) == Error::InvalidDifficulty);
        CHECK(check_difficulty(1'000'000) == Error::InvalidDifficulty);
    }

    TEST_CASE("check_thread_count - accepts 1..64") {
        CHECK_FALSE(check_thread_count(1).has_value());
        CHECK_FALSE(check_thread_count(8).has_value());
        CHECK_FALSE(check_thread_count(64).has_value());
    }

    TEST_CASE("check_thread_count - rejects 0, 65 and negatives") {
        CHECK(check_thread_count(0) == Error::InvalidThreadCount);
        CHECK(check_thread_count(65) == Error::InvalidThreadCount);
        CHECK(check_thread_count(100) == Error::InvalidThreadCount);
        CHECK(check_thread_count(-4) == Error::InvalidThreadCount);
    }

    TEST_CASE("check_parallel_params - difficulty reported first") {
        CHECK(check_parallel_params(65, 0) == Error::InvalidDifficulty);
        CHECK(check_parallel_params(2, 0) == Error::InvalidThreadCount);
        CHECK_FALSE(check_parallel_params(2, 4).has_value());
    }

    TEST_CASE("describe - stable reason strings") {
        CHECK(describe(Error::InvalidDifficulty) == "Difficulty too high (max 64)");
        CHECK(describe(Error::InvalidThreadCount) == "Invalid number of threads (1-64)");
        CHECK(describe(Error::Exhausted) == "No valid nonce found");
        CHECK(describe(Error::Internal) == "Internal hashing failure");
    }

    TEST_CASE("Result - value and error access") {
        auto ok = Result<std::uint64_t>::success(7);
        CHECK(ok.ok());
        CHECK(static_cast<bool>(ok));
        CHECK(ok.value() == 7);
        CHECK(ok.reason().empty());
        CHECK_THROWS_AS(ok.error(), std::logic_error);

        auto bad = Result<std::uint64_t>::failure(Error::Exhausted);
        CHECK_FALSE(bad.ok());
        CHECK(bad.error() == Error::Exhausted);
        CHECK(bad.reason() == "No valid nonce found");
        CHECK_THROWS_AS(bad.value(), std::logic_error);
    }
}
