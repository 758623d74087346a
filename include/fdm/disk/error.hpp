// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace fdm::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    sync_error,
    handle_invalid,
    directory_error,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "fdm::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:          return "Success";
            case DiskErrc::file_not_found:   return "File not found";
            case DiskErrc::access_denied:    return "Access denied";
            case DiskErrc::disk_full:        return "No space left on device";
            case DiskErrc::invalid_path:     return "Invalid path";
            case DiskErrc::write_error:      return "Write error";
            case DiskErrc::read_error:       return "Read error";
            case DiskErrc::sync_error:       return "Failed to flush data to disk";
            case DiskErrc::handle_invalid:   return "Invalid handle";
            case DiskErrc::directory_error:  return "Could not create directory";
            default:                         return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Translate an errno value from a failed write/open into a DiskErrc
[[nodiscard]] std::error_code from_errno(int err, DiskErrc fallback) noexcept;

} // namespace fdm::disk

namespace std {

template<>
struct is_error_code_enum<fdm::disk::DiskErrc> : true_type {};

} // namespace std
