// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/config.hpp>
#include <fdm/core/download_engine.hpp>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace fdm::cli {

// Process exit codes
enum ExitCode : int {
    exit_ok = 0,
    exit_usage = 1,
    exit_probe = 2,
    exit_fragment = 3,      // retries exhausted or non-retryable request
    exit_merge = 4,
    exit_config = 5,
    exit_disk = 6,
    exit_cancelled = 7,
    exit_timeout = 8,
};

enum class Command : std::uint8_t {
    none,
    download,
    config,
    help,
    version
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string config_path{core::DEFAULT_CONFIG_FILE};
    bool verbose{false};

    // download
    std::string url;
    std::string filename;

    // config
    bool show{false};
    bool save{false};

    // Overrides shared by both commands
    std::optional<std::uint32_t> fragments;
    std::optional<std::size_t> chunk_size;
    std::optional<std::uint32_t> timeout;
    std::optional<std::uint32_t> retry_attempts;
    std::optional<std::string> output_dir;
    std::optional<std::string> temp_dir;
    std::optional<bool> verify_ssl;
    std::optional<bool> show_progress;
    std::optional<core::ProgressStyle> progress_style;

    std::string error;      // set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Layer command-line overrides onto a loaded configuration
void apply_overrides(const CliArgs& args, core::DownloadConfig& config);

[[nodiscard]] int exit_code_for(const std::error_code& error) noexcept;

// "fdm download": returns the process exit code
[[nodiscard]] int download(const CliArgs& args, core::DownloadConfig config);

// "fdm config": with --show prints the stored configuration unchanged,
// otherwise applies the overrides, optionally saves, and prints the result
[[nodiscard]] int configure(const CliArgs& args, core::DownloadConfig config, std::ostream& out);

void print_config(const core::DownloadConfig& config, std::ostream& out);

// Completion summary for a finished job
void print_summary(const core::JobResult& result, std::ostream& out);

// Terminal error line for a failed job
void print_failure(const core::JobFailure& failure, std::ostream& out);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

// Install the "fdm" stderr logger as spdlog's default
void setup_logging(bool verbose, bool progress_active);

} // namespace fdm::cli
