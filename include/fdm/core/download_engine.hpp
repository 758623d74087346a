// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/config.hpp>
#include <fdm/core/error.hpp>
#include <fdm/core/fragment.hpp>
#include <fdm/core/http_session.hpp>
#include <fdm/core/progress.hpp>
#include <fdm/core/retry_policy.hpp>
#include <fdm/core/url.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace fdm::core {

// Job state machine
enum class JobState : std::uint8_t {
    idle,                   // Not started
    probing,                // Asking the server for size and range support
    planning,               // Splitting the resource into fragments
    downloading,            // Fragment workers running
    fallback_downloading,   // Single-stream retry after fragmentation failed
    merging,                // Concatenating stores into the destination
    completed,              // All done
    failed                  // Terminal error
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

struct DownloadRequest {
    std::string url;
    std::string filename;   // empty = derive from the server or the URL
};

// One logical transfer, owned by the engine for the duration of run()
struct DownloadJob {
    std::string url;
    std::string name;
    std::filesystem::path destination;
    std::optional<std::uint64_t> total_size;
    bool supports_ranges{false};
    std::uint32_t fragment_count{1};
    std::uint32_t concurrency{1};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
};

struct JobResult {
    DownloadJob job;
    std::uint64_t bytes{0};
    std::uint32_t fragments{0};         // fragments in the plan that completed the job
    bool fell_back{false};
    std::chrono::steady_clock::duration elapsed{};
    ProgressSnapshot final_snapshot;
};

struct JobFailure {
    std::error_code error;              // classifies the failure, see error_kind()
    std::error_code cause;              // underlying transport, disk or validation error
    JobState stage{JobState::idle};
    std::int32_t http_status{0};        // last HTTP status observed, 0 if none
    std::optional<std::uint32_t> fragment;
    ProgressSnapshot final_snapshot;

    [[nodiscard]] ErrorKind kind() const noexcept { return error_kind(error); }
};

// Explicit name, then the server's Content-Disposition name, then the URL basename,
// then "downloaded_file". Each candidate is reduced to a single safe path component.
[[nodiscard]] std::string resolve_filename(std::string_view explicit_name,
                                           std::string_view suggested_name,
                                           const Url& url);

// Drives probe -> plan -> download (with single-stream fallback) -> merge
class DownloadEngine {
public:
    explicit DownloadEngine(DownloadConfig config);
    DownloadEngine(DownloadConfig config, std::shared_ptr<HttpTransport> transport);
    ~DownloadEngine() = default;

    // Non-copyable, non-movable (atomic members can't be moved)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) = delete;
    DownloadEngine& operator=(DownloadEngine&&) = delete;

    // Run one job to completion on the calling thread. `user_stop` is linked to cancel().
    [[nodiscard]] std::expected<JobResult, JobFailure>
    run(const DownloadRequest& request, std::stop_token user_stop = {}) noexcept;

    // Job-scoped cancellation; safe from any thread, including a signal watcher
    void cancel() noexcept { job_stop_.request_stop(); }

    [[nodiscard]] JobState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Thread-safe progress view
    [[nodiscard]] ProgressSnapshot snapshot() const { return progress_.snapshot(); }

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

private:
    // Index of the fragment whose failure ends the plan, if any
    [[nodiscard]] std::optional<std::uint32_t>
    download_plan(std::vector<Fragment>& plan, std::stop_token job_stop, bool single_stream);

    void set_state(JobState state) noexcept;
    [[nodiscard]] TransferOptions transfer_options() const noexcept;

    DownloadConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    RetryPolicy retry_;

    std::atomic<JobState> state_{JobState::idle};
    std::atomic<bool> timed_out_{false};
    std::stop_source job_stop_;
    ProgressAggregator progress_;
    DownloadJob job_;
};

} // namespace fdm::core
