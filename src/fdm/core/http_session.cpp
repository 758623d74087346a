// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace fdm::core {

namespace {

constexpr long MIN_BUFFER_SIZE = 1024;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::error_code error_from_curl(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

// Options shared by probe and fetch
void apply_common_options(CURL* curl, const std::string& url, const TransferOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.timeout.count()));

    // Stall detection: abort when under 1 byte/s for `timeout` seconds
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.timeout.count()));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_ssl ? 2L : 0L);

    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
}

std::string to_lower(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Header callback for probe responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // Each redirect hop starts a new header block
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    (*headers)[to_lower(name)] = std::string(value);
    return total;
}

struct ProbeContext {
    std::stop_token stop;
    bool body_started{false};
};

// Probe only needs headers: stop at the first body byte
std::size_t probe_write_callback(char*, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<ProbeContext*>(userdata);
    if (size * nmemb == 0) return 0;
    ctx->body_started = true;
    return 0;
}

int probe_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<ProbeContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

struct FetchContext {
    CURL* curl = nullptr;
    const ChunkSink* sink = nullptr;
    std::stop_token stop;
    bool ranged{false};
    bool status_checked{false};
    std::error_code abort_reason;   // set when a callback aborts the transfer
};

// libcurl write callback
std::size_t fetch_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<FetchContext*>(userdata);
    std::size_t total = size * nmemb;

    if (ctx->stop.stop_requested()) {
        ctx->abort_reason = make_error_code(DownloadErrc::cancelled);
        return 0;
    }

    // A ranged request answered with the whole resource is unusable
    if (!ctx->status_checked) {
        ctx->status_checked = true;
        long http_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (ctx->ranged && http_code == 200) {
            ctx->abort_reason = make_error_code(DownloadErrc::range_not_honored);
            return 0;
        }
    }

    try {
        auto ec = (*ctx->sink)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total));
        if (ec) {
            ctx->abort_reason = ec;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Chunk sink threw: {}", e.what());
        ctx->abort_reason = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    return total;
}

// libcurl progress callback - checks stop_requested and aborts if set
int fetch_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<FetchContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

std::optional<std::uint64_t> parse_u64(const std::string& text) noexcept {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    unsigned long long val = std::strtoull(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size()) return std::nullopt;
    return static_cast<std::uint64_t>(val);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, TransferResult>
HttpSession::probe(const std::string& url, const TransferOptions& options, std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(TransferResult{make_error_code(DownloadErrc::network_error), 0});
    }

    try {
        HttpResponse response{};
        ProbeContext ctx{stop};

        apply_common_options(curl.ptr, url, options);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, "0-0");

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, probe_write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, probe_progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        // Aborting after the headers is the normal probe outcome
        if (result == CURLE_WRITE_ERROR && ctx.body_started) {
            result = CURLE_OK;
        }
        if (result != CURLE_OK) {
            spdlog::debug("Probe of {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(TransferResult{error_from_curl(result), response.status_code});
        }

        auto cl_it = response.headers.find("content-length");
        if (cl_it != response.headers.end()) {
            response.content_length = parse_u64(cl_it->second);
        }

        auto cd_it = response.headers.find("content-disposition");
        if (cd_it != response.headers.end() && !cd_it->second.empty()) {
            response.filename = parse_content_disposition(cd_it->second);
        }

        spdlog::debug("Probe of {} -> HTTP {}", url, response.status_code);
        return response;
    } catch (const std::exception& e) {
        spdlog::error("Probe of {} failed: {}", url, e.what());
        return std::unexpected(TransferResult{make_error_code(DownloadErrc::network_error), 0});
    }
}

TransferResult
HttpSession::fetch(const FetchRequest& request, const ChunkSink& sink, std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return {make_error_code(DownloadErrc::network_error), 0};
    }

    if (request.end && *request.end <= request.offset) {
        return {make_error_code(DownloadErrc::invalid_range), 0};
    }

    try {
        FetchContext ctx;
        ctx.curl = curl.ptr;
        ctx.sink = &sink;
        ctx.stop = stop;
        ctx.ranged = request.ranged;

        apply_common_options(curl.ptr, request.url, request.options);
        curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);

        // Range header: bytes=start-end (inclusive) or bytes=start-
        std::string range;
        if (request.ranged) {
            range = std::to_string(request.offset) + "-";
            if (request.end) {
                range += std::to_string(*request.end - 1);
            }
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, fetch_write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

        // Set progress callback to allow interruption
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, fetch_progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        long buffer = std::clamp(static_cast<long>(request.options.buffer_size),
                                 MIN_BUFFER_SIZE, static_cast<long>(CURL_MAX_READ_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, buffer);

        CURLcode result = curl_easy_perform(curl.ptr);

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        auto status = static_cast<std::int32_t>(http_code);

        if (ctx.abort_reason) {
            return {ctx.abort_reason, status};
        }
        if (result == CURLE_HTTP_RETURNED_ERROR) {
            return {error_from_http_status(status), status};
        }
        if (result != CURLE_OK) {
            spdlog::debug("Fetch of {} at offset {} failed: {}",
                          request.url, request.offset, curl_easy_strerror(result));
            return {error_from_curl(result), status};
        }
        // Empty body never reached the write callback
        if (request.ranged && status == 200) {
            return {make_error_code(DownloadErrc::range_not_honored), status};
        }
        return {{}, status};
    } catch (const std::exception& e) {
        spdlog::error("Fetch of {} failed: {}", request.url, e.what());
        return {make_error_code(DownloadErrc::network_error), 0};
    }
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    // Prefer RFC 5987 filename*=UTF-8''name over plain filename=
    auto ext_pos = content_disposition.find("filename*=");
    if (ext_pos != std::string_view::npos) {
        auto value = content_disposition.substr(ext_pos + 10);
        auto quote = value.find("''");
        if (quote != std::string_view::npos) {
            value = value.substr(quote + 2);
            auto semi = value.find(';');
            if (semi != std::string_view::npos) value = value.substr(0, semi);
            if (!value.empty()) return std::string(value);
        }
    }

    // Parse "attachment; filename=file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) return {};

    auto filename = content_disposition.substr(filename_pos + 9);
    if (!filename.empty() && (filename.front() == '"' || filename.front() == '\'')) {
        char quote = filename.front();
        filename.remove_prefix(1);
        auto close = filename.find(quote);
        if (close != std::string_view::npos) filename = filename.substr(0, close);
    } else {
        auto semi = filename.find(';');
        if (semi != std::string_view::npos) filename = filename.substr(0, semi);
        while (!filename.empty() && filename.back() == ' ') filename.remove_suffix(1);
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace fdm::core
