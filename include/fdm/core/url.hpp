// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace fdm::core {

// Validated absolute URL. Only the parts the downloader needs are kept.
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    // The URL as given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }

    // Last path segment, percent-decoded. Empty when the path ends with '/'.
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string path_;
};

// Reduce a server- or user-supplied name to a safe single path component
[[nodiscard]] std::string sanitize_filename(std::string_view name);

} // namespace fdm::core
