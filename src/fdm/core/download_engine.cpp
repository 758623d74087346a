// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/download_engine.hpp>
#include <fdm/core/cancel.hpp>
#include <fdm/core/fragment_worker.hpp>
#include <fdm/core/merger.hpp>
#include <fdm/core/range_probe.hpp>
#include <fdm/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <thread>

namespace fdm::core {

namespace {

// Failure precedence when several fragments fail in one plan
int severity(const std::error_code& ec) noexcept {
    switch (error_kind(ec)) {
        case ErrorKind::disk_io:               return 3;
        case ErrorKind::non_retryable_request: return 2;
        default:                               return 1;
    }
}

bool all_completed(const std::vector<Fragment>& plan) noexcept {
    return std::all_of(plan.begin(), plan.end(),
                       [](const Fragment& f) { return f.state == FragmentState::completed; });
}

std::string describe_size(std::optional<std::uint64_t> size) {
    return size ? std::to_string(*size) + " bytes" : std::string("unknown size");
}

} // namespace

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::idle:                 return "idle";
        case JobState::probing:              return "probing";
        case JobState::planning:             return "planning";
        case JobState::downloading:          return "downloading";
        case JobState::fallback_downloading: return "fallback_downloading";
        case JobState::merging:              return "merging";
        case JobState::completed:            return "completed";
        case JobState::failed:               return "failed";
    }
    return "unknown";
}

std::string resolve_filename(std::string_view explicit_name,
                             std::string_view suggested_name,
                             const Url& url) {
    for (auto candidate : {std::string(explicit_name), std::string(suggested_name), url.filename()}) {
        auto name = sanitize_filename(candidate);
        if (!name.empty()) return name;
    }
    return std::string(DEFAULT_FILENAME);
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(DownloadConfig config)
    : DownloadEngine(std::move(config), std::make_shared<HttpSession>()) {}

DownloadEngine::DownloadEngine(DownloadConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , retry_(RetryPolicy::from_config(config_)) {}

void DownloadEngine::set_state(JobState state) noexcept {
    auto previous = state_.exchange(state, std::memory_order_acq_rel);
    spdlog::debug("Job state: {} -> {}", to_string(previous), to_string(state));
}

TransferOptions DownloadEngine::transfer_options() const noexcept {
    TransferOptions options;
    options.timeout = std::chrono::seconds(config_.timeout);
    options.verify_ssl = config_.verify_ssl;
    options.buffer_size = config_.chunk_size;
    return options;
}

std::optional<std::uint32_t>
DownloadEngine::download_plan(std::vector<Fragment>& plan, std::stop_token job_stop, bool single_stream) {
    // A failing fragment stops its own plan without cancelling the job
    std::stop_source plan_stop;
    std::stop_callback link(job_stop, [&plan_stop] { plan_stop.request_stop(); });

    WorkerOptions options;
    options.url = job_.url;
    options.transfer = transfer_options();
    options.retry = retry_;
    options.single_stream = single_stream;

    std::atomic<std::size_t> cursor{0};
    std::mutex failure_mutex;
    std::vector<std::uint32_t> failures;    // in the order they were recorded

    auto worker_loop = [&] {
        while (!plan_stop.stop_requested()) {
            auto i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= plan.size()) return;

            FragmentWorker worker(plan[i], *transport_, options, &progress_);
            auto ec = worker.run(plan_stop.get_token());
            if (ec && ec != DownloadErrc::cancelled) {
                std::lock_guard lock(failure_mutex);
                failures.push_back(static_cast<std::uint32_t>(i));
                plan_stop.request_stop();
            }
        }
    };

    const auto pool_size = std::min<std::size_t>(config_.max_concurrent_fragments, plan.size());
    spdlog::info("Downloading {} fragment(s) with {} worker(s)", plan.size(), pool_size);
    {
        std::vector<std::jthread> pool;
        pool.reserve(pool_size);
        for (std::size_t i = 0; i < pool_size; ++i) {
            pool.emplace_back(worker_loop);
        }
    } // join

    if (failures.empty()) return std::nullopt;

    auto root = failures.front();
    for (auto index : failures) {
        if (severity(plan[index].error) > severity(plan[root].error)) root = index;
    }
    return root;
}

std::expected<JobResult, JobFailure>
DownloadEngine::run(const DownloadRequest& request, std::stop_token user_stop) noexcept {
    const auto started = std::chrono::steady_clock::now();
    JobState stage = JobState::idle;

    auto fail = [&](std::error_code error, std::error_code cause,
                    std::int32_t http_status = 0,
                    std::optional<std::uint32_t> fragment = std::nullopt) {
        JobFailure failure;
        failure.error = error;
        failure.cause = cause ? cause : error;
        failure.stage = stage;
        failure.http_status = http_status;
        failure.fragment = fragment;
        failure.final_snapshot = progress_.snapshot();
        set_state(JobState::failed);
        spdlog::error("Download failed during {}: {} ({})",
                      to_string(stage), to_string(error_kind(error)), failure.cause.message());
        return std::unexpected(std::move(failure));
    };

    auto fail_stopped = [&]() {
        auto ec = timed_out_.load(std::memory_order_acquire)
            ? make_error_code(DownloadErrc::job_timeout)
            : make_error_code(DownloadErrc::cancelled);
        return fail(ec, ec);
    };

    try {
        if (auto ec = config_.validate()) {
            return fail(make_error_code(DownloadErrc::invalid_config), ec);
        }

        auto url = Url::parse(request.url);
        if (!url) {
            return fail(url.error(), url.error());
        }

        for (const auto* dir : {&config_.output_directory, &config_.temp_directory}) {
            std::error_code ec;
            std::filesystem::create_directories(*dir, ec);
            if (ec) {
                spdlog::error("Cannot create directory {}: {}", *dir, ec.message());
                return fail(make_error_code(disk::DiskErrc::directory_error), ec);
            }
        }

        std::stop_callback user_link(user_stop, [this] { job_stop_.request_stop(); });
        auto stop = job_stop_.get_token();

        std::jthread watchdog;
        if (config_.job_timeout > 0) {
            auto limit = std::chrono::seconds(config_.job_timeout);
            watchdog = std::jthread([this, limit](std::stop_token wd_stop) {
                if (sleep_for(wd_stop, limit)) {
                    spdlog::warn("Job timeout of {} s reached; cancelling", limit.count());
                    timed_out_.store(true, std::memory_order_release);
                    job_stop_.request_stop();
                }
            });
        }

        job_ = DownloadJob{};
        job_.url = url->str();
        job_.chunk_size = config_.chunk_size;
        job_.concurrency = config_.max_concurrent_fragments;

        //---------------------------------------------------------------------
        // Probing
        //---------------------------------------------------------------------
        stage = JobState::probing;
        set_state(stage);

        RangeProbe probe(*transport_);
        auto probed = probe.run(job_.url, transfer_options(), stop);
        if (!probed && is_retryable(probed.error().error) && !stop.stop_requested()) {
            spdlog::warn("Probe failed ({}); probing once more in {} ms",
                         probed.error().error.message(), retry_.base_delay().count());
            if (sleep_for(stop, retry_.base_delay())) {
                probed = probe.run(job_.url, transfer_options(), stop);
            }
        }
        if (stop.stop_requested()) {
            return fail_stopped();
        }
        if (!probed) {
            return fail(make_error_code(DownloadErrc::probe_failed),
                        probed.error().error, probed.error().http_status);
        }

        job_.total_size = probed->total_size;
        job_.supports_ranges = probed->supports_ranges;

        //---------------------------------------------------------------------
        // Planning
        //---------------------------------------------------------------------
        stage = JobState::planning;
        set_state(stage);

        job_.name = resolve_filename(request.filename, probed->suggested_filename, *url);
        job_.destination = std::filesystem::path(config_.output_directory) / job_.name;

        PlanRequest plan_request;
        plan_request.total_size = job_.total_size;
        plan_request.supports_ranges = job_.supports_ranges;
        plan_request.fragment_count = config_.effective_fragment_count();
        plan_request.min_fragment_size = config_.min_fragment_size;
        plan_request.temp_directory = config_.temp_directory;
        plan_request.base_name = job_.name;

        auto plan = plan_fragments(plan_request);
        job_.fragment_count = static_cast<std::uint32_t>(plan.size());
        progress_.reset(plan);

        spdlog::info("Plan: {} fragment(s) for {} ({}, ranges {})",
                     plan.size(), job_.name, describe_size(job_.total_size),
                     job_.supports_ranges ? "supported" : "unsupported");

        //---------------------------------------------------------------------
        // Downloading
        //---------------------------------------------------------------------
        stage = JobState::downloading;
        set_state(stage);

        bool fell_back = false;
        auto failed = download_plan(plan, stop, plan.size() == 1);

        if (failed && !stop.stop_requested() &&
            error_kind(plan[*failed].error) == ErrorKind::non_retryable_request && plan.size() > 1) {
            const auto& culprit = plan[*failed];
            spdlog::warn("Fragment {} failed ({}, HTTP {}); falling back to a single stream",
                         culprit.index, culprit.error.message(), culprit.last_http_status);

            remove_stores(plan);
            plan = plan_single(job_.total_size, config_.temp_directory, job_.name);
            job_.fragment_count = 1;
            progress_.rebase(plan);
            fell_back = true;

            stage = JobState::fallback_downloading;
            set_state(stage);
            failed = download_plan(plan, stop, true);
        }

        if (stop.stop_requested() && !all_completed(plan)) {
            remove_stores(plan);
            return fail_stopped();
        }
        if (failed) {
            const auto& culprit = plan[*failed];
            remove_stores(plan);
            return fail(culprit.error, culprit.cause, culprit.last_http_status, culprit.index);
        }

        //---------------------------------------------------------------------
        // Merging
        //---------------------------------------------------------------------
        stage = JobState::merging;
        set_state(stage);

        auto merged = merge_fragments(plan, job_.destination, job_.total_size, stop);
        if (!merged) {
            if (merged.error() == DownloadErrc::merge_integrity) {
                spdlog::error("Fragment stores kept in {} for inspection", config_.temp_directory);
                return fail(merged.error(), merged.error());
            }
            remove_stores(plan);
            if (merged.error() == DownloadErrc::cancelled) {
                return fail_stopped();
            }
            return fail(merged.error(), merged.error());
        }

        stage = JobState::completed;
        set_state(stage);

        JobResult result;
        result.job = job_;
        result.bytes = *merged;
        result.fragments = static_cast<std::uint32_t>(plan.size());
        result.fell_back = fell_back;
        result.elapsed = std::chrono::steady_clock::now() - started;
        result.final_snapshot = progress_.snapshot();
        spdlog::info("Download completed: {} ({} bytes)", job_.destination.string(), *merged);
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Download aborted: {}", e.what());
        return fail(make_error_code(disk::DiskErrc::write_error),
                    make_error_code(disk::DiskErrc::write_error));
    }
}

} // namespace fdm::core
