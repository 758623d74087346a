// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fdm::core {

constexpr std::uint32_t DEFAULT_CONCURRENT_FRAGMENTS = 4;
constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;
constexpr std::uint32_t DEFAULT_TIMEOUT_SEC = 30;
constexpr std::uint32_t DEFAULT_RETRY_ATTEMPTS = 3;
constexpr std::uint64_t DEFAULT_MIN_FRAGMENT_SIZE = 256 * 1024;     // 256 KB
constexpr std::uint32_t DEFAULT_RETRY_BASE_DELAY_MS = 1000;
constexpr double DEFAULT_RETRY_BACKOFF = 2.0;
constexpr std::uint32_t DEFAULT_RETRY_MAX_DELAY_MS = 0;             // 0 = uncapped

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr std::size_t MERGE_BUFFER_SIZE = 256 * 1024;               // 256 KB

// Progress sampling
constexpr std::chrono::milliseconds SPEED_SAMPLE_INTERVAL{100};
constexpr std::chrono::milliseconds SPEED_WINDOW{3000};

constexpr std::string_view DEFAULT_CONFIG_FILE = "download_config.json";
constexpr std::string_view DEFAULT_FILENAME = "downloaded_file";

enum class ProgressStyle : std::uint8_t {
    inline_,
    full_screen,
    simple
};

[[nodiscard]] std::string_view to_string(ProgressStyle style) noexcept;
[[nodiscard]] std::optional<ProgressStyle> parse_progress_style(std::string_view name) noexcept;

// Runtime configuration, persisted as a JSON document
struct DownloadConfig {
    std::uint32_t max_concurrent_fragments{DEFAULT_CONCURRENT_FRAGMENTS};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t timeout{DEFAULT_TIMEOUT_SEC};          // per-request stall, seconds
    std::uint32_t retry_attempts{DEFAULT_RETRY_ATTEMPTS};
    std::string output_directory{"./downloads"};
    std::string temp_directory{"./temp"};
    bool verify_ssl{true};
    bool show_progress{true};
    ProgressStyle progress_style{ProgressStyle::inline_};

    // Engine tuning
    std::uint32_t fragment_count{0};                     // 0 = max_concurrent_fragments
    std::uint64_t min_fragment_size{DEFAULT_MIN_FRAGMENT_SIZE};
    std::uint32_t retry_base_delay_ms{DEFAULT_RETRY_BASE_DELAY_MS};
    double retry_backoff_multiplier{DEFAULT_RETRY_BACKOFF};
    std::uint32_t retry_max_delay_ms{DEFAULT_RETRY_MAX_DELAY_MS};  // 0 = uncapped
    std::uint32_t retry_jitter_ms{0};
    std::uint32_t job_timeout{0};                        // seconds, 0 = disabled

    [[nodiscard]] std::uint32_t effective_fragment_count() const noexcept {
        return fragment_count > 0 ? fragment_count : max_concurrent_fragments;
    }

    // Reject values the engine cannot run with
    [[nodiscard]] std::error_code validate() const noexcept;

    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] static std::expected<DownloadConfig, std::error_code>
    from_json(const nlohmann::json& j) noexcept;

    // Missing file yields defaults
    [[nodiscard]] static std::expected<DownloadConfig, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const noexcept;
};

} // namespace fdm::core
