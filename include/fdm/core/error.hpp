// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace fdm::core {

enum class DownloadErrc {
    success = 0,

    // Transient: resolved inside a fragment by retrying
    network_error,
    timeout,
    refused,
    dns_error,
    connection_lost,
    server_error,
    throttled,

    // Non-retryable request failures
    not_found,
    http_client_error,
    range_not_honored,
    invalid_range,
    ssl_error,
    too_many_redirects,
    invalid_url,

    // Job-level outcomes
    probe_failed,
    retries_exhausted,
    merge_integrity,
    invalid_config,
    cancelled,
    job_timeout,
};

// Coarse classification used for retry decisions, fallback and exit codes
enum class ErrorKind : std::uint8_t {
    none,
    transient_network,
    non_retryable_request,
    probe,
    fragment_exhausted,
    disk_io,
    merge_integrity,
    configuration,
    cancelled,
    timeout,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "fdm::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:            return "Success";
            case DownloadErrc::network_error:      return "Network error";
            case DownloadErrc::timeout:            return "Operation timed out";
            case DownloadErrc::refused:            return "Connection refused";
            case DownloadErrc::dns_error:          return "DNS resolution failed";
            case DownloadErrc::connection_lost:    return "Connection lost";
            case DownloadErrc::server_error:       return "Server error (5xx)";
            case DownloadErrc::throttled:          return "Server asked to slow down (429)";
            case DownloadErrc::not_found:          return "Resource not found (404)";
            case DownloadErrc::http_client_error:  return "Request rejected by server (4xx)";
            case DownloadErrc::range_not_honored:  return "Server ignored the byte range";
            case DownloadErrc::invalid_range:      return "Invalid byte range";
            case DownloadErrc::ssl_error:          return "SSL/TLS certificate verification failed";
            case DownloadErrc::too_many_redirects: return "Too many redirects";
            case DownloadErrc::invalid_url:        return "Invalid URL";
            case DownloadErrc::probe_failed:       return "Could not probe the remote resource";
            case DownloadErrc::retries_exhausted:  return "Fragment exhausted its retry attempts";
            case DownloadErrc::merge_integrity:    return "Merged size does not match the resource size";
            case DownloadErrc::invalid_config:     return "Invalid configuration";
            case DownloadErrc::cancelled:          return "Download cancelled";
            case DownloadErrc::job_timeout:        return "Download exceeded the job timeout";
            default:                               return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Kind of any fdm error code (download or disk category)
[[nodiscard]] ErrorKind error_kind(const std::error_code& ec) noexcept;

// True for failures a fragment worker resolves by re-issuing its request
[[nodiscard]] inline bool is_retryable(const std::error_code& ec) noexcept {
    return error_kind(ec) == ErrorKind::transient_network;
}

// Maps an HTTP error status (>= 400) to an error code. 408 and 429 stay retryable.
[[nodiscard]] std::error_code error_from_http_status(std::int32_t status) noexcept;

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

} // namespace fdm::core

namespace std {

template<>
struct is_error_code_enum<fdm::core::DownloadErrc> : true_type {};

} // namespace std
