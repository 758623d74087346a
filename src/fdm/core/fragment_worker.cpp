// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/fragment_worker.hpp>
#include <fdm/core/cancel.hpp>
#include <fdm/core/progress.hpp>
#include <spdlog/spdlog.h>

namespace fdm::core {

FragmentWorker::FragmentWorker(Fragment& fragment,
                               HttpTransport& transport,
                               const WorkerOptions& options,
                               ProgressAggregator* progress)
    : fragment_(fragment)
    , transport_(transport)
    , options_(options)
    , progress_(progress)
    , rng_(std::random_device{}() ^ fragment.index) {}

void FragmentWorker::set_state(FragmentState state) noexcept {
    fragment_.state = state;
    if (progress_) progress_->update_state(fragment_.index, state);
}

std::error_code FragmentWorker::fail(std::error_code ec) {
    store_.close();
    fragment_.error = ec;
    set_state(FragmentState::failed);

    if (ec == DownloadErrc::cancelled) {
        spdlog::debug("Fragment {} cancelled at {} bytes", fragment_.index, fragment_.bytes_persisted);
    } else {
        spdlog::error("Fragment {} failed after {} attempt(s): {} (cause: {}, HTTP {})",
                      fragment_.index, fragment_.attempts, ec.message(),
                      fragment_.cause ? fragment_.cause.message() : std::string("none"),
                      fragment_.last_http_status);
    }
    return ec;
}

std::error_code FragmentWorker::complete() {
    if (auto ec = store_.sync()) {
        return fail(ec);
    }
    store_.close();
    fragment_.error = {};
    set_state(FragmentState::completed);
    spdlog::debug("Fragment {} completed: {} bytes in {} attempt(s)",
                  fragment_.index, fragment_.bytes_persisted, fragment_.attempts);
    return {};
}

std::error_code FragmentWorker::restart_from_zero() {
    if (auto ec = store_.truncate(0)) return ec;
    fragment_.bytes_persisted = 0;
    if (progress_) progress_->reset_fragment(fragment_.index, ProgressAggregator::Clock::now());
    return {};
}

TransferResult FragmentWorker::request_once(std::stop_token stop) {
    const auto length = fragment_.length();

    FetchRequest request;
    request.url = options_.url;
    request.offset = fragment_.offset();
    request.end = fragment_.end;
    request.options = options_.transfer;
    // The whole resource from byte 0 needs no Range header
    request.ranged = !(options_.single_stream && fragment_.start == 0 && fragment_.bytes_persisted == 0);

    ChunkSink sink = [&](std::span<const std::byte> data) -> std::error_code {
        if (stop.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }
        if (length && fragment_.bytes_persisted + data.size() > *length) {
            return make_error_code(DownloadErrc::invalid_range);
        }
        if (auto ec = store_.write(data)) {
            return ec;
        }
        // Counter advances only once the chunk is in the store
        fragment_.bytes_persisted += data.size();
        if (progress_) {
            progress_->ingest(fragment_.index, data.size(), ProgressAggregator::Clock::now());
        }
        return {};
    };

    return transport_.fetch(request, sink, stop);
}

std::error_code FragmentWorker::run(std::stop_token stop) noexcept {
    try {
        const auto length = fragment_.length();

        if (auto ec = store_.open(fragment_.store_path, fragment_.bytes_persisted)) {
            return fail(ec);
        }

        while (true) {
            if (stop.stop_requested()) {
                return fail(make_error_code(DownloadErrc::cancelled));
            }
            if (length && fragment_.bytes_persisted == *length) {
                return complete();
            }

            ++fragment_.attempts;
            set_state(FragmentState::downloading);

            auto result = request_once(stop);
            if (result.http_status != 0) {
                fragment_.last_http_status = result.http_status;
            }

            auto ec = result.error;
            if (!ec) {
                if (!length || fragment_.bytes_persisted == *length) {
                    return complete();
                }
                // Stream ended early; resume from what was persisted
                ec = make_error_code(DownloadErrc::connection_lost);
            }
            fragment_.cause = ec;

            if (stop.stop_requested() || ec == DownloadErrc::cancelled) {
                return fail(make_error_code(DownloadErrc::cancelled));
            }
            if (error_kind(ec) == ErrorKind::disk_io) {
                return fail(ec);
            }

            auto retry_cause = ec;
            if (ec == DownloadErrc::range_not_honored && options_.single_stream) {
                // Server ignored the resume offset: start the resource over without a Range header
                if (auto disk_ec = restart_from_zero()) {
                    return fail(disk_ec);
                }
                retry_cause = make_error_code(DownloadErrc::connection_lost);
            }

            if (!options_.retry.should_retry(fragment_.attempts, retry_cause)) {
                return fail(is_retryable(retry_cause) ? make_error_code(DownloadErrc::retries_exhausted)
                                                      : ec);
            }

            std::uniform_real_distribution<double> unit(0.0, 1.0);
            auto delay = options_.retry.delay(fragment_.attempts, unit(rng_));

            spdlog::warn("Fragment {} attempt {}/{} failed: {}; retrying from byte {} in {} ms",
                         fragment_.index, fragment_.attempts, options_.retry.max_attempts(),
                         ec.message(), fragment_.offset(), delay.count());

            set_state(FragmentState::retry_waiting);
            if (!sleep_for(stop, delay)) {
                return fail(make_error_code(DownloadErrc::cancelled));
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Fragment {} aborted: {}", fragment_.index, e.what());
        store_.close();
        fragment_.error = make_error_code(DownloadErrc::network_error);
        set_state(FragmentState::failed);
        return fragment_.error;
    }
}

} // namespace fdm::core
