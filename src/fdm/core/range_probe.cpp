// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/range_probe.hpp>
#include <spdlog/spdlog.h>
#include <charconv>

namespace fdm::core {

namespace {

std::optional<std::uint64_t> parse_number(std::string_view text) noexcept {
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

} // namespace

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    constexpr std::string_view UNIT = "bytes";
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    if (!value.starts_with(UNIT)) return std::nullopt;
    value.remove_prefix(UNIT.size());

    auto slash = value.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    auto range = value.substr(0, slash);
    auto complete = value.substr(slash + 1);
    while (!range.empty() && range.front() == ' ') range.remove_prefix(1);

    ContentRange result;

    if (range != "*") {
        auto dash = range.find('-');
        if (dash == std::string_view::npos) return std::nullopt;
        result.first = parse_number(range.substr(0, dash));
        result.last = parse_number(range.substr(dash + 1));
        if (!result.first || !result.last || *result.last < *result.first) return std::nullopt;
    }

    while (!complete.empty() && complete.back() == ' ') complete.remove_suffix(1);
    if (complete != "*") {
        result.complete = parse_number(complete);
        if (!result.complete) return std::nullopt;
    }
    return result;
}

std::expected<ProbeResult, TransferResult> interpret_probe(const HttpResponse& response) noexcept {
    const auto status = response.status_code;

    ProbeResult result;
    result.http_status = status;
    result.suggested_filename = response.filename;

    std::optional<ContentRange> range;
    if (auto it = response.headers.find("content-range"); it != response.headers.end()) {
        range = parse_content_range(it->second);
    }

    if (status == 206) {
        if (range) {
            result.total_size = range->complete;
            // Partial content for exactly the requested byte proves range support
            result.supports_ranges = range->complete && range->first == 0u && range->last == 0u;
        }
        return result;
    }

    if (status >= 200 && status < 300) {
        // Whole resource returned: the Range header was ignored
        result.total_size = response.content_length;
        return result;
    }

    if (status == 416 && range && !range->first && range->complete == 0u) {
        // Empty resource: no byte 0 to serve
        result.total_size = 0;
        return result;
    }

    if (status >= 400) {
        return std::unexpected(TransferResult{error_from_http_status(status), status});
    }
    return std::unexpected(TransferResult{make_error_code(DownloadErrc::http_client_error), status});
}

std::expected<ProbeResult, TransferResult>
RangeProbe::run(const std::string& url, const TransferOptions& options, std::stop_token stop) noexcept {
    auto response = transport_.probe(url, options, stop);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto result = interpret_probe(*response);
    if (result) {
        spdlog::info("Probe: HTTP {}, size {}, ranges {}",
                     result->http_status,
                     result->total_size ? std::to_string(*result->total_size) : std::string("unknown"),
                     result->supports_ranges ? "supported" : "unsupported");
    }
    return result;
}

} // namespace fdm::core
