// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/config.hpp>
#include <fdm/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cstdint>
#include <fstream>
#include <limits>

namespace fdm::core {

namespace {

constexpr std::array KNOWN_KEYS = {
    "max_concurrent_fragments", "chunk_size", "timeout", "retry_attempts",
    "output_directory", "temp_directory", "verify_ssl", "show_progress",
    "progress_style", "fragment_count", "min_fragment_size", "retry_base_delay_ms",
    "retry_backoff_multiplier", "retry_max_delay_ms", "retry_jitter_ms", "job_timeout",
};

bool is_known_key(std::string_view key) noexcept {
    for (const auto* known : KNOWN_KEYS) {
        if (key == known) return true;
    }
    return false;
}

// Read an optional field, failing on a type mismatch or a value that does not fit T
template<typename T>
bool read_unsigned(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    // Non-negative values parsed as signed integers are still acceptable
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->template get<std::int64_t>() < 0)) {
        spdlog::error("Configuration field '{}' must be a non-negative integer", key);
        return false;
    }
    const auto value = it->template get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        spdlog::error("Configuration field '{}' is out of range (at most {})",
                      key, std::numeric_limits<T>::max());
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool read_string(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        spdlog::error("Configuration field '{}' must be a string", key);
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_bool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) {
        spdlog::error("Configuration field '{}' must be true or false", key);
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool read_double(const nlohmann::json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number()) {
        spdlog::error("Configuration field '{}' must be a number", key);
        return false;
    }
    out = it->get<double>();
    return true;
}

} // namespace

std::string_view to_string(ProgressStyle style) noexcept {
    switch (style) {
        case ProgressStyle::inline_:     return "inline";
        case ProgressStyle::full_screen: return "full_screen";
        case ProgressStyle::simple:      return "simple";
    }
    return "inline";
}

std::optional<ProgressStyle> parse_progress_style(std::string_view name) noexcept {
    if (name == "inline") return ProgressStyle::inline_;
    if (name == "full_screen") return ProgressStyle::full_screen;
    if (name == "simple") return ProgressStyle::simple;
    return std::nullopt;
}

std::error_code DownloadConfig::validate() const noexcept {
    const auto invalid = [](std::string_view what) {
        spdlog::error("Invalid configuration: {}", what);
        return make_error_code(DownloadErrc::invalid_config);
    };

    if (max_concurrent_fragments == 0) return invalid("max_concurrent_fragments must be at least 1");
    if (chunk_size == 0) return invalid("chunk_size must be at least 1");
    if (timeout == 0) return invalid("timeout must be at least 1 second");
    if (retry_attempts == 0) return invalid("retry_attempts must be at least 1");
    if (retry_backoff_multiplier < 1.0) return invalid("retry_backoff_multiplier must be >= 1");
    if (output_directory.empty()) return invalid("output_directory is empty");
    if (temp_directory.empty()) return invalid("temp_directory is empty");
    return {};
}

nlohmann::json DownloadConfig::to_json() const {
    return nlohmann::json{
        {"max_concurrent_fragments", max_concurrent_fragments},
        {"chunk_size", chunk_size},
        {"timeout", timeout},
        {"retry_attempts", retry_attempts},
        {"output_directory", output_directory},
        {"temp_directory", temp_directory},
        {"verify_ssl", verify_ssl},
        {"show_progress", show_progress},
        {"progress_style", std::string(to_string(progress_style))},
        {"fragment_count", fragment_count},
        {"min_fragment_size", min_fragment_size},
        {"retry_base_delay_ms", retry_base_delay_ms},
        {"retry_backoff_multiplier", retry_backoff_multiplier},
        {"retry_max_delay_ms", retry_max_delay_ms},
        {"retry_jitter_ms", retry_jitter_ms},
        {"job_timeout", job_timeout},
    };
}

std::expected<DownloadConfig, std::error_code>
DownloadConfig::from_json(const nlohmann::json& j) noexcept {
    const auto bad = std::unexpected(make_error_code(DownloadErrc::invalid_config));

    if (!j.is_object()) {
        spdlog::error("Configuration document must be a JSON object");
        return bad;
    }

    try {
        DownloadConfig cfg;

        for (const auto& [key, value] : j.items()) {
            if (!is_known_key(key)) {
                spdlog::warn("Ignoring unknown configuration field '{}'", key);
            }
        }

        bool ok = read_unsigned(j, "max_concurrent_fragments", cfg.max_concurrent_fragments)
               && read_unsigned(j, "chunk_size", cfg.chunk_size)
               && read_unsigned(j, "timeout", cfg.timeout)
               && read_unsigned(j, "retry_attempts", cfg.retry_attempts)
               && read_string(j, "output_directory", cfg.output_directory)
               && read_string(j, "temp_directory", cfg.temp_directory)
               && read_bool(j, "verify_ssl", cfg.verify_ssl)
               && read_bool(j, "show_progress", cfg.show_progress)
               && read_unsigned(j, "fragment_count", cfg.fragment_count)
               && read_unsigned(j, "min_fragment_size", cfg.min_fragment_size)
               && read_unsigned(j, "retry_base_delay_ms", cfg.retry_base_delay_ms)
               && read_double(j, "retry_backoff_multiplier", cfg.retry_backoff_multiplier)
               && read_unsigned(j, "retry_max_delay_ms", cfg.retry_max_delay_ms)
               && read_unsigned(j, "retry_jitter_ms", cfg.retry_jitter_ms)
               && read_unsigned(j, "job_timeout", cfg.job_timeout);
        if (!ok) return bad;

        std::string style_name{to_string(cfg.progress_style)};
        if (!read_string(j, "progress_style", style_name)) return bad;
        auto style = parse_progress_style(style_name);
        if (!style) {
            spdlog::error("Invalid progress_style '{}'. Use: inline, full_screen, or simple", style_name);
            return bad;
        }
        cfg.progress_style = *style;

        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return bad;
    }
}

std::expected<DownloadConfig, std::error_code>
DownloadConfig::load(const std::filesystem::path& path) noexcept {
    std::error_code fs_ec;
    if (!std::filesystem::exists(path, fs_ec)) {
        spdlog::debug("No configuration at {}, using defaults", path.string());
        return DownloadConfig{};
    }

    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        auto j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded()) {
            spdlog::error("Configuration file {} is not valid JSON", path.string());
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }
        return from_json(j);
    } catch (const std::exception& e) {
        spdlog::error("Error loading configuration {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::error_code DownloadConfig::save(const std::filesystem::path& path) const noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }

        file << to_json().dump(2) << '\n';
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Error saving configuration {}: {}", path.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace fdm::core
