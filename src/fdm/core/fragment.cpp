// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/fragment.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace fdm::core {

std::string_view to_string(FragmentState state) noexcept {
    switch (state) {
        case FragmentState::pending:       return "pending";
        case FragmentState::downloading:   return "downloading";
        case FragmentState::retry_waiting: return "retry_waiting";
        case FragmentState::completed:     return "completed";
        case FragmentState::failed:        return "failed";
    }
    return "unknown";
}

std::filesystem::path store_path_for(const std::filesystem::path& temp_directory,
                                     std::string_view base_name,
                                     std::uint32_t index) {
    std::string name(base_name);
    name += ".part";
    name += std::to_string(index);
    return temp_directory / name;
}

std::vector<Fragment> plan_single(std::optional<std::uint64_t> total_size,
                                  const std::filesystem::path& temp_directory,
                                  std::string_view base_name) {
    Fragment fragment;
    fragment.index = 0;
    fragment.start = 0;
    fragment.end = total_size;
    fragment.store_path = store_path_for(temp_directory, base_name, 0);

    std::vector<Fragment> plan;
    plan.push_back(std::move(fragment));
    return plan;
}

std::vector<Fragment> plan_fragments(const PlanRequest& request) {
    const auto count = request.fragment_count;

    if (!request.supports_ranges || !request.total_size || count <= 1 ||
        *request.total_size < request.min_fragment_size) {
        return plan_single(request.total_size, request.temp_directory, request.base_name);
    }

    const auto total = *request.total_size;
    const auto share = total / count;   // may be 0: leading fragments are then empty

    std::vector<Fragment> plan;
    plan.reserve(count);

    for (std::uint32_t i = 0; i < count; ++i) {
        Fragment fragment;
        fragment.index = i;
        fragment.start = static_cast<std::uint64_t>(i) * share;
        fragment.end = (i + 1 == count) ? total : fragment.start + share;
        fragment.store_path = store_path_for(request.temp_directory, request.base_name, i);
        plan.push_back(std::move(fragment));
    }

    spdlog::debug("Planned {} fragments of {} bytes (last {})",
                  count, share, total - static_cast<std::uint64_t>(count - 1) * share);
    return plan;
}

} // namespace fdm::core
