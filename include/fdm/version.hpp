// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace fdm {

constexpr std::string_view PRODUCT_NAME = "Fragment Download Manager";

constexpr struct Version {
    std::uint32_t major = 1;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;

    [[nodiscard]] std::string to_string() const {
        return fmt::format("{}.{}.{}", major, minor, patch);
    }
} version;

constexpr std::string_view BUILD_DATE = __DATE__;

} // namespace fdm
