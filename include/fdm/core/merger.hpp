// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/fragment.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <system_error>
#include <vector>

namespace fdm::core {

// Concatenates completed fragment stores into the destination, in index order.
//
// Output is staged in "<destination>.partial" and renamed over the destination only
// once every store and the total byte count check out. The stores are removed after
// the rename; on any failure they are left in place and the partial file is deleted.
//
// expected_total: the resource size, or nullopt to accept the persisted byte count.
// Returns the number of bytes written.
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
merge_fragments(const std::vector<Fragment>& fragments,
                const std::filesystem::path& destination,
                std::optional<std::uint64_t> expected_total,
                std::stop_token stop = {}) noexcept;

// Remove every fragment store, ignoring ones that do not exist
void remove_stores(const std::vector<Fragment>& fragments) noexcept;

} // namespace fdm::core
