// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/config.hpp>
#include <fdm/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace fdm::core {

// Per-request transport knobs derived from DownloadConfig
struct TransferOptions {
    std::chrono::seconds timeout{DEFAULT_TIMEOUT_SEC};   // connect and stall timeout
    bool verify_ssl{true};
    std::size_t buffer_size{DEFAULT_CHUNK_SIZE};
};

// Headers of a probe response
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;         // lower-case names
    std::optional<std::uint64_t> content_length;
    std::string filename;                               // From Content-Disposition
};

// Outcome of one request: error is empty on success
struct TransferResult {
    std::error_code error;
    std::int32_t http_status{0};

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// Streamed byte range request
struct FetchRequest {
    std::string url;
    std::uint64_t offset{0};
    std::optional<std::uint64_t> end;                   // exclusive, nullopt = until EOF
    bool ranged{true};                                  // send a Range header, require 206
    TransferOptions options;
};

// Receives body bytes in order. A non-empty return aborts the transfer with that error.
using ChunkSink = std::function<std::error_code(std::span<const std::byte>)>;

// Seam between the engine and the network
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // GET with "Range: bytes=0-0"; reads headers only
    [[nodiscard]] virtual std::expected<HttpResponse, TransferResult>
    probe(const std::string& url, const TransferOptions& options, std::stop_token stop) noexcept = 0;

    // Stream [offset, end) into sink until done, failed or stopped
    [[nodiscard]] virtual TransferResult
    fetch(const FetchRequest& request, const ChunkSink& sink, std::stop_token stop) noexcept = 0;
};

// libcurl transport. One easy handle per request; safe to share between workers.
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, TransferResult>
    probe(const std::string& url, const TransferOptions& options, std::stop_token stop) noexcept override;

    [[nodiscard]] TransferResult
    fetch(const FetchRequest& request, const ChunkSink& sink, std::stop_token stop) noexcept override;

    // Parse Content-Disposition header value
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);

    // Global initialization (call once at startup, before any thread uses curl)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace fdm::core
