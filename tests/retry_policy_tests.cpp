// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fdm/core/retry_policy.hpp>
#include <fdm/disk/error.hpp>
#include <cstdint>

using namespace fdm::core;
using namespace std::chrono_literals;

TEST_CASE("RetryPolicy - exponential delay", "[retry]") {
    RetryPolicy policy(5, 1000ms, 2.0, 0ms);

    CHECK(policy.delay(1) == 1000ms);
    CHECK(policy.delay(2) == 2000ms);
    CHECK(policy.delay(3) == 4000ms);
    CHECK(policy.delay(5) == 16'000ms);
    CHECK(policy.delay(6) == 32'000ms);

    SECTION("Attempt zero behaves like the first") {
        CHECK(policy.delay(0) == 1000ms);
    }

    SECTION("Huge attempt numbers saturate") {
        CHECK(policy.delay(5000) > 0ms);
        CHECK(policy.delay(5000) == policy.delay(6000));
    }
}

TEST_CASE("RetryPolicy - default config grows strictly", "[retry]") {
    DownloadConfig config;
    config.retry_attempts = 20;
    auto policy = RetryPolicy::from_config(config);

    CHECK(policy.max_delay() == 0ms);

    auto previous = 0ms;
    for (std::uint32_t k = 1; k < config.retry_attempts; ++k) {
        INFO("attempt " << k);
        auto expected = std::chrono::milliseconds(
            static_cast<std::int64_t>(DEFAULT_RETRY_BASE_DELAY_MS) << (k - 1));
        CHECK(policy.delay(k) == expected);
        CHECK(policy.delay(k) > previous);
        previous = policy.delay(k);
    }
}

TEST_CASE("RetryPolicy - optional ceiling", "[retry]") {
    RetryPolicy policy(5, 1000ms, 2.0, 30'000ms);

    CHECK(policy.delay(5) == 16'000ms);
    CHECK(policy.delay(6) == 30'000ms);
    CHECK(policy.delay(200) == 30'000ms);
}

TEST_CASE("RetryPolicy - jitter stays within bounds", "[retry]") {
    RetryPolicy policy(3, 100ms, 2.0, 1000ms, 50ms);

    CHECK(policy.delay(1, 0.0) == 100ms);
    CHECK(policy.delay(1, 0.5) == 125ms);
    CHECK(policy.delay(2, 0.99) >= 200ms);
    CHECK(policy.delay(2, 0.99) < 250ms);
    CHECK(policy.delay(1, -3.0) == 100ms);
}

TEST_CASE("RetryPolicy - should_retry", "[retry]") {
    RetryPolicy policy(3, 1ms, 2.0, 10ms);

    SECTION("Transient errors while attempts remain") {
        CHECK(policy.should_retry(1, make_error_code(DownloadErrc::connection_lost)));
        CHECK(policy.should_retry(2, make_error_code(DownloadErrc::timeout)));
        CHECK(policy.should_retry(2, make_error_code(DownloadErrc::server_error)));
        CHECK(policy.should_retry(1, make_error_code(DownloadErrc::throttled)));
    }

    SECTION("Exhausted") {
        CHECK(!policy.should_retry(3, make_error_code(DownloadErrc::connection_lost)));
    }

    SECTION("Non-retryable") {
        CHECK(!policy.should_retry(1, make_error_code(DownloadErrc::not_found)));
        CHECK(!policy.should_retry(1, make_error_code(DownloadErrc::range_not_honored)));
        CHECK(!policy.should_retry(1, make_error_code(fdm::disk::DiskErrc::disk_full)));
        CHECK(!policy.should_retry(1, make_error_code(DownloadErrc::cancelled)));
    }
}

TEST_CASE("RetryPolicy::from_config", "[retry]") {
    DownloadConfig config;
    config.retry_attempts = 7;
    config.retry_base_delay_ms = 250;
    config.retry_backoff_multiplier = 3.0;
    config.retry_max_delay_ms = 5000;
    config.retry_jitter_ms = 20;

    auto policy = RetryPolicy::from_config(config);
    CHECK(policy.max_attempts() == 7);
    CHECK(policy.base_delay() == 250ms);
    CHECK(policy.multiplier() == 3.0);
    CHECK(policy.max_delay() == 5000ms);
    CHECK(policy.jitter() == 20ms);
    CHECK(policy.delay(3) == 2250ms);
}

TEST_CASE("Error classification", "[retry]") {
    CHECK(error_kind({}) == ErrorKind::none);
    CHECK(error_kind(make_error_code(DownloadErrc::dns_error)) == ErrorKind::transient_network);
    CHECK(error_kind(make_error_code(DownloadErrc::ssl_error)) == ErrorKind::non_retryable_request);
    CHECK(error_kind(make_error_code(DownloadErrc::retries_exhausted)) == ErrorKind::fragment_exhausted);
    CHECK(error_kind(make_error_code(fdm::disk::DiskErrc::write_error)) == ErrorKind::disk_io);
    CHECK(error_kind(std::make_error_code(std::errc::no_space_on_device)) == ErrorKind::disk_io);

    CHECK(error_from_http_status(200) == std::error_code{});
    CHECK(error_from_http_status(404) == DownloadErrc::not_found);
    CHECK(error_from_http_status(403) == DownloadErrc::http_client_error);
    CHECK(error_from_http_status(408) == DownloadErrc::timeout);
    CHECK(error_from_http_status(429) == DownloadErrc::throttled);
    CHECK(error_from_http_status(503) == DownloadErrc::server_error);
    CHECK(is_retryable(error_from_http_status(500)));
    CHECK(!is_retryable(error_from_http_status(401)));
}
