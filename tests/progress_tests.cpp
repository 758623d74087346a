// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fdm/core/progress.hpp>
#include <thread>
#include <vector>

using namespace fdm::core;
using namespace std::chrono_literals;
using Clock = ProgressAggregator::Clock;

namespace {

std::vector<Fragment> even_plan(std::uint64_t total, std::uint32_t count) {
    PlanRequest request;
    request.total_size = total;
    request.supports_ranges = true;
    request.fragment_count = count;
    request.temp_directory = "tmp";
    request.base_name = "f";
    return plan_fragments(request);
}

} // namespace

TEST_CASE("ProgressAggregator - bytes and percent", "[progress]") {
    ProgressAggregator progress;
    const auto t0 = Clock::now();
    progress.reset(even_plan(4000, 4), t0);

    progress.ingest(0, 1000, t0 + 200ms);
    progress.ingest(1, 500, t0 + 200ms);

    auto snap = progress.snapshot(t0 + 300ms);
    CHECK(snap.bytes_downloaded == 1500);
    CHECK(snap.bytes_total == std::optional<std::uint64_t>(4000));
    CHECK(snap.percent == Catch::Approx(37.5));
    REQUIRE(snap.fragments.size() == 4);
    CHECK(snap.fragments[0].percent == Catch::Approx(100.0));
    CHECK(snap.fragments[1].percent == Catch::Approx(50.0));
    CHECK(snap.fragments[2].bytes == 0);
    CHECK(snap.elapsed == 300ms);
}

TEST_CASE("ProgressAggregator - windowed speed", "[progress]") {
    ProgressAggregator progress(3000ms, 100ms);
    const auto t0 = Clock::now();
    progress.reset(even_plan(100'000, 1), t0);

    progress.ingest(0, 1000, t0 + 1s);
    progress.ingest(0, 1000, t0 + 2s);

    SECTION("Rate over the samples seen so far") {
        auto snap = progress.snapshot(t0 + 2s);
        CHECK(snap.speed == Catch::Approx(1000.0));
        CHECK(snap.fragments[0].speed == Catch::Approx(1000.0));
    }

    SECTION("Stalled fragment decays to zero") {
        auto snap = progress.snapshot(t0 + 10s);
        CHECK(snap.speed == Catch::Approx(0.0));
        CHECK(snap.bytes_downloaded == 2000);
    }
}

TEST_CASE("ProgressAggregator - aggregate speed sums fragments", "[progress]") {
    ProgressAggregator progress(3000ms, 100ms);
    const auto t0 = Clock::now();
    progress.reset(even_plan(100'000, 2), t0);

    progress.ingest(0, 2000, t0 + 1s);
    progress.ingest(1, 1000, t0 + 1s);

    auto snap = progress.snapshot(t0 + 1s);
    CHECK(snap.fragments[0].speed == Catch::Approx(2000.0));
    CHECK(snap.fragments[1].speed == Catch::Approx(1000.0));
    CHECK(snap.speed == Catch::Approx(3000.0));
}

TEST_CASE("ProgressAggregator - samples are throttled but bytes are not", "[progress]") {
    ProgressAggregator progress(3000ms, 100ms);
    const auto t0 = Clock::now();
    progress.reset(even_plan(100'000, 1), t0);

    for (int i = 1; i <= 50; ++i) {
        progress.ingest(0, 10, t0 + std::chrono::milliseconds(i));
    }
    CHECK(progress.snapshot(t0 + 60ms).bytes_downloaded == 500);
}

TEST_CASE("ProgressAggregator - downloaded bytes never decrease", "[progress]") {
    ProgressAggregator progress;
    const auto t0 = Clock::now();
    auto plan = even_plan(4000, 2);
    progress.reset(plan, t0);

    progress.ingest(0, 1500, t0 + 200ms);
    progress.ingest(1, 900, t0 + 200ms);
    CHECK(progress.snapshot(t0 + 300ms).bytes_downloaded == 2400);

    SECTION("A fragment restarting from zero") {
        progress.reset_fragment(1, t0 + 400ms);
        auto snap = progress.snapshot(t0 + 500ms);
        CHECK(snap.fragments[1].bytes == 0);
        CHECK(snap.bytes_downloaded == 2400);
    }

    SECTION("Fallback to a fresh single plan") {
        progress.rebase(plan_single(4000, "tmp", "f"), t0 + 400ms);

        auto snap = progress.snapshot(t0 + 500ms);
        REQUIRE(snap.fragments.size() == 1);
        CHECK(snap.bytes_downloaded == 2400);

        progress.ingest(0, 3000, t0 + 600ms);
        CHECK(progress.snapshot(t0 + 700ms).bytes_downloaded == 3000);
    }

    SECTION("A new job starts over") {
        progress.reset(even_plan(4000, 2), t0 + 1s);
        CHECK(progress.snapshot(t0 + 1s).bytes_downloaded == 0);
    }
}

TEST_CASE("ProgressAggregator - unknown total", "[progress]") {
    ProgressAggregator progress;
    const auto t0 = Clock::now();
    progress.reset(plan_single(std::nullopt, "tmp", "f"), t0);

    progress.ingest(0, 12345, t0 + 200ms);
    auto snap = progress.snapshot(t0 + 300ms);
    CHECK(!snap.bytes_total.has_value());
    CHECK(snap.percent == 0.0);
    CHECK(snap.bytes_downloaded == 12345);

    progress.update_state(0, FragmentState::completed);
    snap = progress.snapshot(t0 + 400ms);
    CHECK(snap.percent == 100.0);
    CHECK(snap.completed_fragments == 1);
}

TEST_CASE("ProgressAggregator - concurrent ingest", "[progress]") {
    ProgressAggregator progress;
    progress.reset(even_plan(1'000'000, 4));

    {
        std::vector<std::jthread> writers;
        for (std::uint32_t w = 0; w < 4; ++w) {
            writers.emplace_back([&progress, w] {
                for (int i = 0; i < 1000; ++i) {
                    progress.ingest(w, 10, Clock::now());
                }
            });
        }
        for (int i = 0; i < 20; ++i) {
            auto snap = progress.snapshot();
            CHECK(snap.bytes_downloaded <= 40'000);
        }
    }

    auto snap = progress.snapshot();
    CHECK(snap.bytes_downloaded == 40'000);
    for (const auto& fragment : snap.fragments) {
        CHECK(fragment.bytes == 10'000);
    }
}
