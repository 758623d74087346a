// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/fragment.hpp>
#include <fdm/core/http_session.hpp>
#include <fdm/core/retry_policy.hpp>
#include <fdm/disk/file_writer.hpp>
#include <cstdint>
#include <random>
#include <stop_token>
#include <string>
#include <system_error>

namespace fdm::core {

class ProgressAggregator;

struct WorkerOptions {
    std::string url;
    TransferOptions transfer;
    RetryPolicy retry;
    bool single_stream{false};   // the plan is one fragment spanning the resource
};

// Downloads one fragment into its temporary store, resuming from the persisted
// offset after transient failures.
class FragmentWorker {
public:
    FragmentWorker(Fragment& fragment,
                   HttpTransport& transport,
                   const WorkerOptions& options,
                   ProgressAggregator* progress = nullptr);

    FragmentWorker(const FragmentWorker&) = delete;
    FragmentWorker& operator=(const FragmentWorker&) = delete;

    // Drive the fragment to completed or failed. Returns the fragment's error (empty on success).
    [[nodiscard]] std::error_code run(std::stop_token stop) noexcept;

private:
    [[nodiscard]] TransferResult request_once(std::stop_token stop);
    [[nodiscard]] std::error_code restart_from_zero();
    [[nodiscard]] std::error_code complete();
    std::error_code fail(std::error_code ec);
    void set_state(FragmentState state) noexcept;

    Fragment& fragment_;
    HttpTransport& transport_;
    const WorkerOptions& options_;
    ProgressAggregator* progress_;
    disk::FileWriter store_;
    std::mt19937 rng_;
};

} // namespace fdm::core
