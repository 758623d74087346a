// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/http_session.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace fdm::core {

// What the server disclosed about the resource
struct ProbeResult {
    std::optional<std::uint64_t> total_size;   // nullopt = unknown length
    bool supports_ranges{false};               // never true with an unknown size
    std::string suggested_filename;            // From Content-Disposition, unsanitized
    std::int32_t http_status{0};
};

// Parsed "bytes first-last/complete" or "bytes */complete"
struct ContentRange {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    std::optional<std::uint64_t> complete;     // nullopt for "*"
};

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Interpret the answer to a "Range: bytes=0-0" request
[[nodiscard]] std::expected<ProbeResult, TransferResult>
interpret_probe(const HttpResponse& response) noexcept;

class RangeProbe {
public:
    explicit RangeProbe(HttpTransport& transport) noexcept : transport_(transport) {}

    // The error carries the underlying cause and last HTTP status
    [[nodiscard]] std::expected<ProbeResult, TransferResult>
    run(const std::string& url, const TransferOptions& options, std::stop_token stop) noexcept;

private:
    HttpTransport& transport_;
};

} // namespace fdm::core
