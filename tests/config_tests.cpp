// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fdm/core/config.hpp>
#include <fdm/disk/error.hpp>
#include <nlohmann/json.hpp>
#include "test_support.hpp"

using namespace fdm::core;
using nlohmann::json;

TEST_CASE("DownloadConfig defaults", "[config]") {
    DownloadConfig config;

    CHECK(config.max_concurrent_fragments == 4);
    CHECK(config.chunk_size == 8192);
    CHECK(config.timeout == 30);
    CHECK(config.retry_attempts == 3);
    CHECK(config.output_directory == "./downloads");
    CHECK(config.temp_directory == "./temp");
    CHECK(config.verify_ssl);
    CHECK(config.show_progress);
    CHECK(config.progress_style == ProgressStyle::inline_);
    CHECK(config.effective_fragment_count() == 4);
    CHECK(!config.validate());
}

TEST_CASE("DownloadConfig::validate", "[config]") {
    DownloadConfig config;

    SECTION("Zero fragments") { config.max_concurrent_fragments = 0; }
    SECTION("Zero chunk size") { config.chunk_size = 0; }
    SECTION("Zero timeout") { config.timeout = 0; }
    SECTION("Zero attempts") { config.retry_attempts = 0; }
    SECTION("Shrinking backoff") { config.retry_backoff_multiplier = 0.5; }
    SECTION("No output directory") { config.output_directory.clear(); }
    SECTION("No temp directory") { config.temp_directory.clear(); }

    CHECK(config.validate() == DownloadErrc::invalid_config);
}

TEST_CASE("DownloadConfig::from_json", "[config]") {
    SECTION("Partial document keeps defaults") {
        auto config = DownloadConfig::from_json(json{{"max_concurrent_fragments", 8}, {"verify_ssl", false}});
        REQUIRE(config.has_value());
        CHECK(config->max_concurrent_fragments == 8);
        CHECK(!config->verify_ssl);
        CHECK(config->chunk_size == DEFAULT_CHUNK_SIZE);
        CHECK(config->retry_attempts == DEFAULT_RETRY_ATTEMPTS);
    }

    SECTION("Progress style") {
        auto config = DownloadConfig::from_json(json{{"progress_style", "full_screen"}});
        REQUIRE(config.has_value());
        CHECK(config->progress_style == ProgressStyle::full_screen);

        CHECK(!DownloadConfig::from_json(json{{"progress_style", "fancy"}}).has_value());
    }

    SECTION("Unknown fields are ignored") {
        auto config = DownloadConfig::from_json(json{{"colour", "blue"}, {"timeout", 10}});
        REQUIRE(config.has_value());
        CHECK(config->timeout == 10);
    }

    SECTION("Type mismatches are rejected") {
        CHECK(DownloadConfig::from_json(json{{"timeout", "thirty"}}).error() == DownloadErrc::invalid_config);
        CHECK(!DownloadConfig::from_json(json{{"chunk_size", -1}}).has_value());
        CHECK(!DownloadConfig::from_json(json{{"show_progress", 1}}).has_value());
        CHECK(!DownloadConfig::from_json(json{{"output_directory", 5}}).has_value());
        CHECK(!DownloadConfig::from_json(json::array({1, 2})).has_value());
    }

    SECTION("Values wider than the field are rejected") {
        auto wide = DownloadConfig::from_json(json::parse(R"({"max_concurrent_fragments": 4294967297})"));
        REQUIRE(!wide.has_value());
        CHECK(wide.error() == DownloadErrc::invalid_config);
        CHECK(!DownloadConfig::from_json(json{{"timeout", 4'294'967'296ull}}).has_value());

        auto widest = DownloadConfig::from_json(json{{"timeout", 4'294'967'295ull}});
        REQUIRE(widest.has_value());
        CHECK(widest->timeout == 4'294'967'295u);

        auto big = DownloadConfig::from_json(json{{"min_fragment_size", 8'589'934'592ull}});
        REQUIRE(big.has_value());
        CHECK(big->min_fragment_size == 8'589'934'592ull);
    }
}

TEST_CASE("DownloadConfig save and load", "[config]") {
    fdm::test::TempDir dir;
    const auto path = dir / "nested" / "download_config.json";

    DownloadConfig original;
    original.max_concurrent_fragments = 6;
    original.chunk_size = 16384;
    original.output_directory = "/data/downloads";
    original.progress_style = ProgressStyle::simple;
    original.retry_jitter_ms = 250;
    original.job_timeout = 600;

    REQUIRE(!original.save(path));

    auto loaded = DownloadConfig::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->to_json() == original.to_json());

    auto document = json::parse(fdm::test::read_file(path));
    CHECK(document["progress_style"] == "simple");
    CHECK(document["max_concurrent_fragments"] == 6);
}

TEST_CASE("DownloadConfig::load", "[config]") {
    fdm::test::TempDir dir;

    SECTION("Missing file yields defaults") {
        auto config = DownloadConfig::load(dir / "absent.json");
        REQUIRE(config.has_value());
        CHECK(config->to_json() == DownloadConfig{}.to_json());
    }

    SECTION("Malformed JSON") {
        fdm::test::write_file(dir / "bad.json", "{ not json");
        auto config = DownloadConfig::load(dir / "bad.json");
        REQUIRE(!config.has_value());
        CHECK(config.error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("Progress style names", "[config]") {
    CHECK(to_string(ProgressStyle::inline_) == "inline");
    CHECK(parse_progress_style("simple") == ProgressStyle::simple);
    CHECK(!parse_progress_style("Simple").has_value());
}
