// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/error.hpp>
#include <fdm/disk/error.hpp>

namespace fdm::core {

ErrorKind error_kind(const std::error_code& ec) noexcept {
    if (!ec) return ErrorKind::none;

    if (ec.category() == disk::disk_errc_category()) {
        return ErrorKind::disk_io;
    }
    if (ec.category() != download_errc_category()) {
        // Foreign codes (std::errc from the filesystem library) only come from disk paths
        return ErrorKind::disk_io;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::success:
            return ErrorKind::none;
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::refused:
        case DownloadErrc::dns_error:
        case DownloadErrc::connection_lost:
        case DownloadErrc::server_error:
        case DownloadErrc::throttled:
            return ErrorKind::transient_network;
        case DownloadErrc::not_found:
        case DownloadErrc::http_client_error:
        case DownloadErrc::range_not_honored:
        case DownloadErrc::invalid_range:
        case DownloadErrc::ssl_error:
        case DownloadErrc::too_many_redirects:
            return ErrorKind::non_retryable_request;
        case DownloadErrc::probe_failed:
            return ErrorKind::probe;
        case DownloadErrc::retries_exhausted:
            return ErrorKind::fragment_exhausted;
        case DownloadErrc::merge_integrity:
            return ErrorKind::merge_integrity;
        case DownloadErrc::invalid_url:
        case DownloadErrc::invalid_config:
            return ErrorKind::configuration;
        case DownloadErrc::cancelled:
            return ErrorKind::cancelled;
        case DownloadErrc::job_timeout:
            return ErrorKind::timeout;
    }
    return ErrorKind::non_retryable_request;
}

std::error_code error_from_http_status(std::int32_t status) noexcept {
    if (status < 400) return {};
    if (status >= 500) return make_error_code(DownloadErrc::server_error);

    switch (status) {
        case 404: return make_error_code(DownloadErrc::not_found);
        case 408: return make_error_code(DownloadErrc::timeout);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        case 429: return make_error_code(DownloadErrc::throttled);
        default:  return make_error_code(DownloadErrc::http_client_error);
    }
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::none:                  return "none";
        case ErrorKind::transient_network:     return "TransientNetworkError";
        case ErrorKind::non_retryable_request: return "NonRetryableRequestError";
        case ErrorKind::probe:                 return "ProbeError";
        case ErrorKind::fragment_exhausted:    return "FragmentExhausted";
        case ErrorKind::disk_io:               return "DiskIOError";
        case ErrorKind::merge_integrity:       return "MergeIntegrityError";
        case ErrorKind::configuration:         return "ConfigurationError";
        case ErrorKind::cancelled:             return "Cancelled";
        case ErrorKind::timeout:               return "JobTimeout";
    }
    return "unknown";
}

} // namespace fdm::core
