// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/config.hpp>
#include <fdm/core/fragment.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace fdm::core {

// Per-fragment view inside a snapshot
struct FragmentProgress {
    std::uint32_t index{0};
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> total;
    double percent{0.0};                  // 0..100
    double speed{0.0};                    // bytes/s over the sample window
    FragmentState state{FragmentState::pending};
};

// Immutable point-in-time view of a job
struct ProgressSnapshot {
    std::vector<FragmentProgress> fragments;
    std::uint64_t bytes_downloaded{0};    // never decreases within a job
    std::optional<std::uint64_t> bytes_total;
    double percent{0.0};
    double speed{0.0};                    // sum of fragment speeds
    std::uint32_t completed_fragments{0};
    std::chrono::steady_clock::duration elapsed{};
};

// Collects byte deltas from concurrent workers and produces snapshots.
// ingest() never blocks; snapshot() may be called from any thread.
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressAggregator(std::chrono::milliseconds window = SPEED_WINDOW,
                                std::chrono::milliseconds sample_interval = SPEED_SAMPLE_INTERVAL);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Start a new job with its first plan
    void reset(const std::vector<Fragment>& plan, Clock::time_point now = Clock::now());

    // Install a replacement plan (fallback). No worker may be running.
    // Aggregate bytes stay at their high-water mark until the new plan passes it.
    void rebase(const std::vector<Fragment>& plan, Clock::time_point now = Clock::now());

    // Byte-delta event from a worker
    void ingest(std::uint32_t index, std::uint64_t bytes_added, Clock::time_point timestamp) noexcept;

    // The fragment restarted from byte 0
    void reset_fragment(std::uint32_t index, Clock::time_point now) noexcept;

    void update_state(std::uint32_t index, FragmentState state) noexcept;

    [[nodiscard]] ProgressSnapshot snapshot(Clock::time_point now = Clock::now()) const;

private:
    struct Sample {
        Clock::time_point time;
        std::uint64_t bytes;              // cumulative
    };

    struct Slot {
        std::atomic<std::uint64_t> bytes{0};
        std::atomic<FragmentState> state{FragmentState::pending};
        std::optional<std::uint64_t> total;   // fixed for the plan's lifetime

        std::mutex samples_mutex;
        std::deque<Sample> samples;
    };

    void install(const std::vector<Fragment>& plan, Clock::time_point now);
    [[nodiscard]] double speed_of(Slot& slot, std::uint64_t bytes, Clock::time_point now) const;

    std::chrono::milliseconds window_;
    std::chrono::milliseconds sample_interval_;

    mutable std::mutex plan_mutex_;       // guards slots_ against rebase
    std::unique_ptr<Slot[]> slots_;
    std::size_t slot_count_{0};
    Clock::time_point started_{Clock::now()};

    mutable std::mutex high_water_mutex_;
    mutable std::uint64_t high_water_{0};
};

} // namespace fdm::core
