/*
 * Unit tests for command line parsing
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include <powex/cli/args.hpp>
#include <powex/logging/fmt_logger.hpp>

using namespace powex;

namespace {

config::ParseResult parse_args(std::vector<std::string> args) {
    args.insert(args.begin(), "powex");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    logging::FmtLogger log;
    return cli::parse(static_cast<int>(args.size()), argv.data(), log);
}

} // namespace

TEST_SUITE("CLI args") {
    TEST_CASE("compute - sequential by default") {
        auto pr = parse_args({"compute", "--data", "hello world", "--difficulty", "4"});
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->command == config::Command::Compute);
        CHECK(pr.request->payload.data == "hello world");
        CHECK(pr.request->difficulty == 4);
        CHECK_FALSE(pr.request->parallel);
        CHECK_FALSE(pr.request->threads.has_value());
        CHECK(pr.config_path == "powex.conf");
    }

    TEST_CASE("compute - threads imply parallel") {
        auto pr = parse_args({"compute", "--data", "x", "-D", "3", "-t", "8"});
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->parallel);
        REQUIRE(pr.request->threads.has_value());
        CHECK(*pr.request->threads == 8);
    }

    TEST_CASE("compute - out of range values are left for the engine") {
        auto pr = parse_args({"compute", "--data", "x", "-D", "65", "-t", "0"});
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->difficulty == 65);
        CHECK(*pr.request->threads == 0);
    }

    TEST_CASE("compute - difficulty is required") {
        auto pr = parse_args({"compute", "--data", "x"});
        CHECK_FALSE(pr.request.has_value());
        CHECK_FALSE(pr.show_only);
    }

    TEST_CASE("verify and hash need a nonce") {
        CHECK_FALSE(parse_args({"verify", "--data", "x", "-D", "1"}).request.has_value());
        CHECK_FALSE(parse_args({"hash", "--data", "x"}).request.has_value());

        auto pr = parse_args({"hash", "--data", "test data", "--nonce", "12345"});
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->command == config::Command::Hash);
        CHECK(pr.request->nonce == "12345");
    }

    TEST_CASE("bench - default difficulty 4") {
        auto pr = parse_args({"bench", "--data", "bench", "--debug", "--config", "other.conf"});
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->command == config::Command::Bench);
        CHECK(pr.request->difficulty == 4);
        CHECK(pr.debug);
        CHECK(pr.config_path == "other.conf");
    }

    TEST_CASE("hex payload flag") {
        auto pr = parse_args({"hash", "--hex", "--data", "010203", "-n", "7"});
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->payload.hex);

        crypto::Payload payload;
        std::string err;
        REQUIRE(cli::load_payload(pr.request->payload, payload, err));
        CHECK(payload == crypto::Payload{1, 2, 3});
    }

    TEST_CASE("load_payload - errors") {
        crypto::Payload payload;
        std::string err;

        config::PayloadSource bad_hex;
        bad_hex.data = "0g";
        bad_hex.hex = true;
        CHECK_FALSE(cli::load_payload(bad_hex, payload, err));

        config::PayloadSource missing;
        missing.file = "no/such/payload.bin";
        CHECK_FALSE(cli::load_payload(missing, payload, err));
        CHECK(err.find("cannot open") != std::string::npos);
    }

    TEST_CASE("help, version and unknown commands") {
        CHECK(parse_args({"--help"}).show_only);
        CHECK(parse_args({"--version"}).show_only);

        auto unknown = parse_args({"mine", "--data", "x"});
        CHECK_FALSE(unknown.request.has_value());
        CHECK_FALSE(unknown.show_only);

        CHECK_FALSE(parse_args({}).request.has_value());
    }
}
