// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace fdm::core {

// Fragment state machine. Downloading <-> retry_waiting may cycle; everything else moves forward.
enum class FragmentState : std::uint8_t {
    pending,        // Not started
    downloading,    // Request in flight
    retry_waiting,  // Backing off before the next attempt
    completed,      // All bytes persisted
    failed          // Gave up
};

[[nodiscard]] std::string_view to_string(FragmentState state) noexcept;

// One planned byte range [start, end) and its download bookkeeping
struct Fragment {
    std::uint32_t index{0};                 // merge order
    std::uint64_t start{0};
    std::optional<std::uint64_t> end;       // exclusive; nullopt = until EOF
    FragmentState state{FragmentState::pending};
    std::uint64_t bytes_persisted{0};
    std::uint32_t attempts{0};              // requests issued
    std::filesystem::path store_path;

    std::error_code error;                  // why the fragment failed
    std::error_code cause;                  // last transport error seen
    std::int32_t last_http_status{0};

    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept {
        if (!end) return std::nullopt;
        return *end - start;
    }

    [[nodiscard]] std::uint64_t offset() const noexcept { return start + bytes_persisted; }

    [[nodiscard]] bool done() const noexcept {
        return state == FragmentState::completed || state == FragmentState::failed;
    }
};

// Inputs to a plan
struct PlanRequest {
    std::optional<std::uint64_t> total_size;
    bool supports_ranges{false};
    std::uint32_t fragment_count{1};
    std::uint64_t min_fragment_size{0};
    std::filesystem::path temp_directory;
    std::string_view base_name;             // store name prefix: <base_name>.part<i>
};

// Partition [0, total_size) into contiguous fragments. Degenerate inputs yield one
// fragment spanning the whole resource.
[[nodiscard]] std::vector<Fragment> plan_fragments(const PlanRequest& request);

// Single fragment spanning the whole resource
[[nodiscard]] std::vector<Fragment> plan_single(std::optional<std::uint64_t> total_size,
                                                const std::filesystem::path& temp_directory,
                                                std::string_view base_name);

// Path of a fragment's temporary store
[[nodiscard]] std::filesystem::path store_path_for(const std::filesystem::path& temp_directory,
                                                   std::string_view base_name,
                                                   std::uint32_t index);

} // namespace fdm::core
