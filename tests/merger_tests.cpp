// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fdm/core/merger.hpp>
#include "test_support.hpp"

using namespace fdm::core;

namespace {

// Write each fragment's slice of `content` into its store and mark it completed
std::vector<Fragment> stage(const fdm::test::TempDir& dir, const std::string& content, std::uint32_t count) {
    PlanRequest request;
    request.total_size = content.size();
    request.supports_ranges = true;
    request.fragment_count = count;
    request.temp_directory = dir.path();
    request.base_name = "out.bin";

    auto plan = plan_fragments(request);
    for (auto& fragment : plan) {
        auto slice = content.substr(fragment.start, *fragment.length());
        fdm::test::write_file(fragment.store_path, slice);
        fragment.bytes_persisted = slice.size();
        fragment.state = FragmentState::completed;
    }
    return plan;
}

} // namespace

TEST_CASE("merge_fragments - concatenates in index order", "[merger]") {
    fdm::test::TempDir dir;
    const auto content = fdm::test::make_content(300'001);
    auto plan = stage(dir, content, 4);
    const auto destination = dir / "out.bin";

    // Completion order is irrelevant
    std::swap(plan[0], plan[3]);

    auto merged = merge_fragments(plan, destination, content.size());
    REQUIRE(merged.has_value());
    CHECK(*merged == content.size());
    CHECK(fdm::test::read_file(destination) == content);

    for (const auto& fragment : plan) {
        CHECK(!std::filesystem::exists(fragment.store_path));
    }
    CHECK(!std::filesystem::exists(dir / "out.bin.partial"));
}

TEST_CASE("merge_fragments - empty resource", "[merger]") {
    fdm::test::TempDir dir;
    auto plan = stage(dir, "", 1);

    auto merged = merge_fragments(plan, dir / "empty.bin", 0);
    REQUIRE(merged.has_value());
    CHECK(*merged == 0);
    CHECK(std::filesystem::exists(dir / "empty.bin"));
    CHECK(std::filesystem::file_size(dir / "empty.bin") == 0);
}

TEST_CASE("merge_fragments - unknown total uses the persisted count", "[merger]") {
    fdm::test::TempDir dir;
    const auto content = fdm::test::make_content(5000);
    auto plan = plan_single(std::nullopt, dir.path(), "stream.bin");
    fdm::test::write_file(plan[0].store_path, content);
    plan[0].bytes_persisted = content.size();
    plan[0].state = FragmentState::completed;

    auto merged = merge_fragments(plan, dir / "stream.bin", std::nullopt);
    REQUIRE(merged.has_value());
    CHECK(*merged == 5000);
    CHECK(fdm::test::read_file(dir / "stream.bin") == content);
}

TEST_CASE("merge_fragments - integrity failures", "[merger]") {
    fdm::test::TempDir dir;
    const auto content = fdm::test::make_content(10'000);
    auto plan = stage(dir, content, 4);
    const auto destination = dir / "out.bin";

    SECTION("Total does not match the resource size") {
        auto merged = merge_fragments(plan, destination, 10'001);
        REQUIRE(!merged.has_value());
        CHECK(merged.error() == DownloadErrc::merge_integrity);
    }

    SECTION("Store shorter than recorded") {
        fdm::test::write_file(plan[2].store_path, content.substr(plan[2].start, 100));
        auto merged = merge_fragments(plan, destination, 10'000);
        REQUIRE(!merged.has_value());
        CHECK(merged.error() == DownloadErrc::merge_integrity);
    }

    SECTION("Fragment not completed") {
        plan[1].state = FragmentState::failed;
        auto merged = merge_fragments(plan, destination, 10'000);
        REQUIRE(!merged.has_value());
        CHECK(merged.error() == DownloadErrc::merge_integrity);
    }

    SECTION("Store missing") {
        std::filesystem::remove(plan[3].store_path);
        auto merged = merge_fragments(plan, destination, 10'000);
        REQUIRE(!merged.has_value());
        CHECK(merged.error() == DownloadErrc::merge_integrity);
    }

    // Nothing is published and the remaining stores are kept for inspection
    CHECK(!std::filesystem::exists(destination));
    CHECK(!std::filesystem::exists(dir / "out.bin.partial"));
    CHECK(std::filesystem::exists(plan[0].store_path));
}

TEST_CASE("merge_fragments - cancelled before copying", "[merger]") {
    fdm::test::TempDir dir;
    const auto content = fdm::test::make_content(10'000);
    auto plan = stage(dir, content, 2);

    std::stop_source stop;
    stop.request_stop();
    auto merged = merge_fragments(plan, dir / "out.bin", 10'000, stop.get_token());
    REQUIRE(!merged.has_value());
    CHECK(merged.error() == DownloadErrc::cancelled);
    CHECK(!std::filesystem::exists(dir / "out.bin"));
    CHECK(std::filesystem::exists(plan[0].store_path));
}

TEST_CASE("remove_stores ignores missing files", "[merger]") {
    fdm::test::TempDir dir;
    auto plan = stage(dir, fdm::test::make_content(100), 2);
    std::filesystem::remove(plan[0].store_path);

    remove_stores(plan);
    CHECK(!std::filesystem::exists(plan[1].store_path));
}
