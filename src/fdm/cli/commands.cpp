// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/cli/commands.hpp>
#include <fdm/cli/presenter.hpp>
#include <fdm/core/cancel.hpp>
#include <fdm/core/http_session.hpp>
#include <fdm/version.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace fdm::core;

namespace fdm::cli {

namespace {

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void on_interrupt(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

// Installs SIGINT/SIGTERM handlers for the lifetime of a download
class InterruptGuard {
public:
    InterruptGuard() {
        g_interrupted.store(false, std::memory_order_relaxed);
        previous_int_ = std::signal(SIGINT, on_interrupt);
        previous_term_ = std::signal(SIGTERM, on_interrupt);
    }
    ~InterruptGuard() {
        std::signal(SIGINT, previous_int_);
        std::signal(SIGTERM, previous_term_);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    void (*previous_int_)(int) = SIG_DFL;
    void (*previous_term_)(int) = SIG_DFL;
};

template<typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

bool is_active(JobState state) noexcept {
    return state == JobState::downloading ||
           state == JobState::fallback_downloading ||
           state == JobState::merging;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Fetch the value of an option that takes one
        auto value = [&](std::string_view option) -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                fail(fmt::format("Option {} requires a value", option));
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        auto number = [&]<typename T>(std::string_view option, std::optional<T>& out) {
            auto text = value(option);
            if (!text) return;
            out = parse_unsigned<T>(*text);
            if (!out) fail(fmt::format("Option {} expects a non-negative integer, got '{}'", option, *text));
        };

        if (arg == "-h" || arg == "--help") {
            args.command = Command::help;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.command = Command::version;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--config") {
            if (auto path = value(arg)) args.config_path = std::string(*path);
        } else if (arg == "-f" || arg == "--filename") {
            if (auto name = value(arg)) args.filename = std::string(*name);
        } else if (arg == "--no-progress") {
            args.show_progress = false;
        } else if (arg == "--show-progress") {
            args.show_progress = true;
        } else if (arg == "--progress-style") {
            if (auto style = value(arg)) {
                args.progress_style = parse_progress_style(*style);
                if (!args.progress_style) {
                    fail(fmt::format("Invalid progress style '{}'. Use: inline, full_screen, or simple", *style));
                }
            }
        } else if (arg == "--fragments") {
            number(arg, args.fragments);
        } else if (arg == "--chunk-size") {
            number(arg, args.chunk_size);
        } else if (arg == "--timeout") {
            number(arg, args.timeout);
        } else if (arg == "--retry-attempts") {
            number(arg, args.retry_attempts);
        } else if (arg == "--output-dir") {
            if (auto dir = value(arg)) args.output_dir = std::string(*dir);
        } else if (arg == "--temp-dir") {
            if (auto dir = value(arg)) args.temp_dir = std::string(*dir);
        } else if (arg == "--ssl-verify") {
            args.verify_ssl = true;
        } else if (arg == "--no-ssl-verify") {
            args.verify_ssl = false;
        } else if (arg == "--show") {
            args.show = true;
        } else if (arg == "--save") {
            args.save = true;
        } else if (arg.starts_with("-")) {
            fail(fmt::format("Unknown option '{}'", arg));
        } else if (args.command == Command::none) {
            if (arg == "download") {
                args.command = Command::download;
            } else if (arg == "config") {
                args.command = Command::config;
            } else {
                fail(fmt::format("Unknown command '{}'", arg));
            }
        } else if (args.command == Command::download && args.url.empty()) {
            args.url = std::string(arg);
        } else {
            fail(fmt::format("Unexpected argument '{}'", arg));
        }
    }

    if (args.command == Command::none) {
        fail("No command specified");
    } else if (args.command == Command::download && args.url.empty()) {
        fail("download requires a URL");
    }
    return args;
}

void apply_overrides(const CliArgs& args, DownloadConfig& config) {
    if (args.fragments) config.max_concurrent_fragments = *args.fragments;
    if (args.chunk_size) config.chunk_size = *args.chunk_size;
    if (args.timeout) config.timeout = *args.timeout;
    if (args.retry_attempts) config.retry_attempts = *args.retry_attempts;
    if (args.output_dir) config.output_directory = *args.output_dir;
    if (args.temp_dir) config.temp_directory = *args.temp_dir;
    if (args.verify_ssl) config.verify_ssl = *args.verify_ssl;
    if (args.show_progress) config.show_progress = *args.show_progress;
    if (args.progress_style) config.progress_style = *args.progress_style;
}

int exit_code_for(const std::error_code& error) noexcept {
    switch (error_kind(error)) {
        case ErrorKind::none:                  return exit_ok;
        case ErrorKind::probe:                 return exit_probe;
        case ErrorKind::transient_network:
        case ErrorKind::non_retryable_request:
        case ErrorKind::fragment_exhausted:    return exit_fragment;
        case ErrorKind::merge_integrity:       return exit_merge;
        case ErrorKind::configuration:         return exit_config;
        case ErrorKind::disk_io:               return exit_disk;
        case ErrorKind::cancelled:             return exit_cancelled;
        case ErrorKind::timeout:               return exit_timeout;
    }
    return exit_fragment;
}

//=============================================================================
// Logging
//=============================================================================

void setup_logging(bool verbose, bool progress_active) {
    auto logger = spdlog::get("fdm");
    if (!logger) {
        logger = spdlog::stderr_color_mt("fdm");
        logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    }
    spdlog::set_default_logger(logger);

    // Progress output owns the terminal; only problems get through
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (progress_active) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

//=============================================================================
// Commands
//=============================================================================

int download(const CliArgs& args, DownloadConfig config) {
    apply_overrides(args, config);
    setup_logging(args.verbose, config.show_progress);

    std::cout << "Starting download: " << args.url << std::endl;

    HttpSession::global_init();
    int exit_code = exit_ok;
    {
        DownloadEngine engine(config);
        InterruptGuard interrupts;

        std::jthread signal_watcher([&engine](std::stop_token stop) {
            while (sleep_for(stop, std::chrono::milliseconds(50))) {
                if (g_interrupted.load(std::memory_order_relaxed)) {
                    spdlog::warn("Interrupted; cancelling download");
                    engine.cancel();
                    return;
                }
            }
        });

        std::unique_ptr<Presenter> presenter;
        std::jthread presenter_thread;
        if (config.show_progress) {
            presenter = make_presenter(config.progress_style, std::cout, terminal_supports_ansi());
            presenter_thread = std::jthread([&engine, view = presenter.get()](std::stop_token stop) {
                do {
                    if (is_active(engine.state())) {
                        view->render(engine.snapshot());
                    }
                } while (sleep_for(stop, view->interval()));
            });
        }

        auto result = engine.run(DownloadRequest{args.url, args.filename});

        if (presenter_thread.joinable()) {
            presenter_thread.request_stop();
            presenter_thread.join();
        }
        if (presenter) {
            const auto& last = result ? result->final_snapshot : result.error().final_snapshot;
            if (!last.fragments.empty()) presenter->finish(last);
        }

        if (result) {
            print_summary(*result, std::cout);
        } else {
            print_failure(result.error(), std::cerr);
            exit_code = exit_code_for(result.error().error);
        }
    }
    HttpSession::global_cleanup();
    return exit_code;
}

int configure(const CliArgs& args, DownloadConfig config, std::ostream& out) {
    if (args.show) {
        print_config(config, out);
        return exit_ok;
    }

    apply_overrides(args, config);

    if (auto ec = config.validate()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return exit_config;
    }

    if (args.save) {
        if (auto ec = config.save(args.config_path)) {
            std::cerr << "Error: could not save " << args.config_path << ": " << ec.message() << std::endl;
            return exit_code_for(ec);
        }
        out << "Configuration saved to " << args.config_path << std::endl;
    }

    print_config(config, out);
    return exit_ok;
}

//=============================================================================
// Output
//=============================================================================

void print_config(const DownloadConfig& config, std::ostream& out) {
    auto enabled = [](bool on) { return on ? "Enabled" : "Disabled"; };

    out << "\n=== Download Manager Configuration ===\n";
    out << "Max concurrent fragments: " << config.max_concurrent_fragments << "\n";
    out << "Chunk size: " << config.chunk_size << " bytes\n";
    out << "Timeout: " << config.timeout << " seconds\n";
    out << "Retry attempts: " << config.retry_attempts << "\n";
    out << "Output directory: " << config.output_directory << "\n";
    out << "Temp directory: " << config.temp_directory << "\n";
    out << "SSL verification: " << enabled(config.verify_ssl) << "\n";
    out << "Show progress: " << enabled(config.show_progress) << "\n";
    out << "Progress style: " << to_string(config.progress_style) << "\n";
    out << "Fragment count: ";
    if (config.fragment_count > 0) {
        out << config.fragment_count << "\n";
    } else {
        out << "same as max concurrent fragments\n";
    }
    out << "Minimum fragment size: " << format_size(static_cast<double>(config.min_fragment_size)) << "\n";
    out << fmt::format("Retry backoff: {} ms x {} (max {}, jitter {} ms)\n",
                       config.retry_base_delay_ms, config.retry_backoff_multiplier,
                       config.retry_max_delay_ms > 0 ? fmt::format("{} ms", config.retry_max_delay_ms)
                                                     : std::string("none"),
                       config.retry_jitter_ms);
    out << "Job timeout: ";
    if (config.job_timeout > 0) {
        out << config.job_timeout << " seconds\n";
    } else {
        out << "Disabled\n";
    }
    out << "=====================================\n" << std::endl;
}

void print_summary(const JobResult& result, std::ostream& out) {
    const double seconds = std::chrono::duration<double>(result.elapsed).count();
    const double throughput = seconds > 0.0 ? static_cast<double>(result.bytes) / seconds : 0.0;

    out << fmt::format("✓ Download completed in {} ({})\n",
                       format_duration(result.elapsed), format_speed(throughput));
    out << fmt::format("✓ File saved to: {} ({})\n",
                       result.job.destination.string(), format_size(static_cast<double>(result.bytes)));
    out << fmt::format("  Fragments: {}{}\n", result.fragments,
                       result.fell_back ? " (fell back to a single stream)" : "");
    out.flush();
}

void print_failure(const JobFailure& failure, std::ostream& out) {
    std::string line = fmt::format("✗ Download failed during {}: {}: {}",
                                   to_string(failure.stage), to_string(failure.kind()),
                                   failure.error.message());
    if (failure.cause && failure.cause != failure.error) {
        line += fmt::format(" (cause: {})", failure.cause.message());
    }
    if (failure.http_status != 0) {
        line += fmt::format(" [HTTP {}]", failure.http_status);
    }
    if (failure.fragment) {
        line += fmt::format(" [fragment {}]", *failure.fragment + 1);
    }
    out << line << std::endl;
}

void print_help(std::string_view program_name) {
    std::cout << PRODUCT_NAME << " " << version.to_string() << " - segmented HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [--config PATH] [--verbose] download <URL> [OPTIONS]\n";
    std::cout << "  " << program_name << " [--config PATH] [--verbose] config [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "GLOBAL OPTIONS:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -V, --verbose              Enable debug logging\n";
    std::cout << "      --config <PATH>        Configuration file (default: download_config.json)\n";
    std::cout << "\n";
    std::cout << "DOWNLOAD OPTIONS:\n";
    std::cout << "  -f, --filename <NAME>      Save as NAME inside the output directory\n";
    std::cout << "      --no-progress          Do not show progress\n";
    std::cout << "      --progress-style <S>   inline, full_screen or simple\n";
    std::cout << "\n";
    std::cout << "CONFIG OPTIONS (also accepted by download, for this run only):\n";
    std::cout << "      --show                 Show the configuration\n";
    std::cout << "      --fragments <N>        Max concurrent fragments\n";
    std::cout << "      --chunk-size <N>       Bytes per streamed read\n";
    std::cout << "      --timeout <N>          Per-request stall timeout, seconds\n";
    std::cout << "      --retry-attempts <N>   Max attempts per fragment\n";
    std::cout << "      --output-dir <DIR>     Final file location\n";
    std::cout << "      --temp-dir <DIR>       Fragment scratch space\n";
    std::cout << "      --ssl-verify           Enable certificate verification\n";
    std::cout << "      --no-ssl-verify        Disable certificate verification\n";
    std::cout << "      --show-progress        Enable progress display\n";
    std::cout << "      --save                 Write the configuration file\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " download https://example.com/large.iso\n";
    std::cout << "  " << program_name << " download https://example.com/file.zip -f archive.zip --progress-style simple\n";
    std::cout << "  " << program_name << " config --fragments 8 --save\n";
}

void print_version() {
    std::cout << PRODUCT_NAME << " " << version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace fdm::cli
