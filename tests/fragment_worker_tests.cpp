// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fdm/core/fragment_worker.hpp>
#include <fdm/core/progress.hpp>
#include <fdm/disk/error.hpp>
#include "fake_transport.hpp"
#include "test_support.hpp"
#include <thread>

using namespace fdm::core;
using namespace std::chrono_literals;
using fdm::test::FakeTransport;

namespace {

constexpr std::size_t RESOURCE_SIZE = 10'000;

WorkerOptions fast_options(std::uint32_t attempts = 3) {
    WorkerOptions options;
    options.url = "http://test/resource.bin";
    options.retry = RetryPolicy(attempts, 1ms, 2.0, 5ms);
    return options;
}

Fragment make_fragment(const fdm::test::TempDir& dir, std::uint64_t start, std::uint64_t end) {
    Fragment fragment;
    fragment.index = 1;
    fragment.start = start;
    fragment.end = end;
    fragment.store_path = dir / "resource.bin.part1";
    return fragment;
}

} // namespace

TEST_CASE("FragmentWorker - downloads its range", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    transport.chunk_size(512);
    auto options = fast_options();
    auto fragment = make_fragment(dir, 2000, 6000);

    FragmentWorker worker(fragment, transport, options);
    auto ec = worker.run({});

    CHECK(!ec);
    CHECK(fragment.state == FragmentState::completed);
    CHECK(fragment.bytes_persisted == 4000);
    CHECK(fragment.attempts == 1);
    CHECK(fdm::test::read_file(fragment.store_path) == transport.content().substr(2000, 4000));

    auto records = transport.records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].offset == 2000);
    CHECK(records[0].end == std::optional<std::uint64_t>(6000));
    CHECK(records[0].ranged);
}

TEST_CASE("FragmentWorker - resumes after a dropped connection", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    transport.chunk_size(100);
    transport.add_fault(2000, 2001, {1500, make_error_code(DownloadErrc::connection_lost), 0});
    auto options = fast_options();
    auto fragment = make_fragment(dir, 2000, 6000);

    FragmentWorker worker(fragment, transport, options);
    CHECK(!worker.run({}));

    CHECK(fragment.attempts == 2);
    CHECK(fragment.cause == DownloadErrc::connection_lost);
    CHECK(fdm::test::read_file(fragment.store_path) == transport.content().substr(2000, 4000));

    auto records = transport.records();
    REQUIRE(records.size() == 2);
    CHECK(records[1].offset == 3500);
    CHECK(records[1].end == std::optional<std::uint64_t>(6000));
}

TEST_CASE("FragmentWorker - premature end of stream is retried", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    transport.add_fault(0, 1, {1000, {}, 0});
    auto options = fast_options();
    auto fragment = make_fragment(dir, 0, 5000);

    FragmentWorker worker(fragment, transport, options);
    CHECK(!worker.run({}));

    CHECK(fragment.attempts == 2);
    auto records = transport.records();
    REQUIRE(records.size() == 2);
    CHECK(records[1].offset == 1000);
    CHECK(fdm::test::read_file(fragment.store_path) == transport.content().substr(0, 5000));
}

TEST_CASE("FragmentWorker - resumes from persisted bytes", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    auto options = fast_options();
    auto fragment = make_fragment(dir, 2000, 6000);

    // 1000 good bytes followed by the tail of a half-written chunk
    fdm::test::write_file(fragment.store_path, transport.content().substr(2000, 1000) + "garbage");
    fragment.bytes_persisted = 1000;

    FragmentWorker worker(fragment, transport, options);
    CHECK(!worker.run({}));

    auto records = transport.records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].offset == 3000);
    CHECK(fdm::test::read_file(fragment.store_path) == transport.content().substr(2000, 4000));
}

TEST_CASE("FragmentWorker - exhausts its attempts", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    transport.add_fault(0, RESOURCE_SIZE, {0, make_error_code(DownloadErrc::server_error), 503}, 100);
    auto options = fast_options(3);
    auto fragment = make_fragment(dir, 0, 5000);

    FragmentWorker worker(fragment, transport, options);
    auto ec = worker.run({});

    CHECK(ec == DownloadErrc::retries_exhausted);
    CHECK(fragment.state == FragmentState::failed);
    CHECK(fragment.error == DownloadErrc::retries_exhausted);
    CHECK(fragment.cause == DownloadErrc::server_error);
    CHECK(fragment.last_http_status == 503);
    CHECK(fragment.attempts == 3);
    CHECK(transport.records().size() == 3);
}

TEST_CASE("FragmentWorker - retry decision follows the policy", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    // One transient failure; a second request would succeed
    transport.add_fault(0, RESOURCE_SIZE, {0, make_error_code(DownloadErrc::server_error), 503}, 1);
    auto fragment = make_fragment(dir, 0, 5000);

    SECTION("A single-attempt policy gives up") {
        auto options = fast_options(1);
        FragmentWorker worker(fragment, transport, options);

        CHECK(worker.run({}) == DownloadErrc::retries_exhausted);
        CHECK(fragment.attempts == 1);
        CHECK(transport.records().size() == 1);
    }

    SECTION("A second attempt recovers") {
        auto options = fast_options(2);
        FragmentWorker worker(fragment, transport, options);

        CHECK(!worker.run({}));
        CHECK(fragment.attempts == 2);
        CHECK(transport.records().size() == 2);
    }
}

TEST_CASE("FragmentWorker - non-retryable failure ends the fragment at once", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    transport.add_fault(0, RESOURCE_SIZE, {0, make_error_code(DownloadErrc::not_found), 404}, 100);
    auto options = fast_options(5);
    auto fragment = make_fragment(dir, 0, 5000);

    FragmentWorker worker(fragment, transport, options);
    auto ec = worker.run({});

    CHECK(ec == DownloadErrc::not_found);
    CHECK(error_kind(ec) == ErrorKind::non_retryable_request);
    CHECK(fragment.attempts == 1);
    CHECK(fragment.last_http_status == 404);
}

TEST_CASE("FragmentWorker - cancellation interrupts the backoff", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    transport.add_fault(0, RESOURCE_SIZE, {0, make_error_code(DownloadErrc::timeout), 0}, 100);

    WorkerOptions options;
    options.url = "http://test/resource.bin";
    options.retry = RetryPolicy(5, 10'000ms, 2.0, 30'000ms);
    auto fragment = make_fragment(dir, 0, 5000);

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    FragmentWorker worker(fragment, transport, options);
    auto ec = worker.run(stop.get_token());

    CHECK(ec == DownloadErrc::cancelled);
    CHECK(fragment.state == FragmentState::failed);
    CHECK(fragment.attempts == 1);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("FragmentWorker - store cannot be opened", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    auto options = fast_options();
    auto fragment = make_fragment(dir, 0, 5000);
    fragment.store_path = dir / "missing" / "resource.bin.part1";

    FragmentWorker worker(fragment, transport, options);
    auto ec = worker.run({});

    CHECK(error_kind(ec) == ErrorKind::disk_io);
    CHECK(fragment.state == FragmentState::failed);
    CHECK(transport.records().empty());
}

TEST_CASE("FragmentWorker - single stream restarts when the offset is ignored", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(4096));
    transport.ignore_ranges(true);
    auto options = fast_options();
    options.single_stream = true;

    Fragment fragment;
    fragment.start = 0;
    fragment.end = 4096;
    fragment.store_path = dir / "resource.bin.part0";
    fdm::test::write_file(fragment.store_path, transport.content().substr(0, 1000));
    fragment.bytes_persisted = 1000;

    ProgressAggregator progress;
    progress.reset({fragment});

    FragmentWorker worker(fragment, transport, options, &progress);
    CHECK(!worker.run({}));

    auto records = transport.records();
    REQUIRE(records.size() == 2);
    CHECK(records[0].ranged);
    CHECK(records[0].offset == 1000);
    CHECK(!records[1].ranged);
    CHECK(fragment.bytes_persisted == 4096);
    CHECK(fdm::test::read_file(fragment.store_path) == transport.content());
}

TEST_CASE("FragmentWorker - empty fragment completes without a request", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    auto options = fast_options();
    auto fragment = make_fragment(dir, 0, 0);

    FragmentWorker worker(fragment, transport, options);
    CHECK(!worker.run({}));
    CHECK(fragment.state == FragmentState::completed);
    CHECK(transport.records().empty());
    CHECK(std::filesystem::exists(fragment.store_path));
}

TEST_CASE("FragmentWorker - unknown length runs to end of stream", "[worker]") {
    fdm::test::TempDir dir;
    FakeTransport transport(fdm::test::make_content(RESOURCE_SIZE));
    auto options = fast_options();
    options.single_stream = true;

    Fragment fragment;
    fragment.store_path = dir / "resource.bin.part0";

    FragmentWorker worker(fragment, transport, options);
    CHECK(!worker.run({}));

    auto records = transport.records();
    REQUIRE(records.size() == 1);
    CHECK(!records[0].ranged);
    CHECK(fragment.bytes_persisted == RESOURCE_SIZE);
    CHECK(fdm::test::read_file(fragment.store_path) == transport.content());
}
