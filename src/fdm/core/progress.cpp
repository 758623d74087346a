// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/progress.hpp>
#include <algorithm>

namespace fdm::core {

namespace {

double percent_of(std::uint64_t bytes, std::optional<std::uint64_t> total, bool complete) noexcept {
    if (!total || *total == 0) {
        return complete ? 100.0 : 0.0;
    }
    return std::min(100.0, static_cast<double>(bytes) * 100.0 / static_cast<double>(*total));
}

} // namespace

ProgressAggregator::ProgressAggregator(std::chrono::milliseconds window,
                                       std::chrono::milliseconds sample_interval)
    : window_(window)
    , sample_interval_(sample_interval) {}

void ProgressAggregator::install(const std::vector<Fragment>& plan, Clock::time_point now) {
    auto slots = std::make_unique<Slot[]>(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        const auto& fragment = plan[i];
        auto& slot = slots[i];
        slot.bytes.store(fragment.bytes_persisted, std::memory_order_relaxed);
        slot.state.store(fragment.state, std::memory_order_relaxed);
        slot.total = fragment.length();
        slot.samples.push_back({now, fragment.bytes_persisted});
    }

    std::lock_guard lock(plan_mutex_);
    slots_ = std::move(slots);
    slot_count_ = plan.size();
}

void ProgressAggregator::reset(const std::vector<Fragment>& plan, Clock::time_point now) {
    install(plan, now);
    std::lock_guard lock(high_water_mutex_);
    high_water_ = 0;
    started_ = now;
}

void ProgressAggregator::rebase(const std::vector<Fragment>& plan, Clock::time_point now) {
    install(plan, now);
}

void ProgressAggregator::ingest(std::uint32_t index, std::uint64_t bytes_added,
                                Clock::time_point timestamp) noexcept {
    if (index >= slot_count_) return;
    auto& slot = slots_[index];

    const auto cumulative = slot.bytes.fetch_add(bytes_added, std::memory_order_relaxed) + bytes_added;

    // Sampling is best effort: skip it rather than wait on a reader
    std::unique_lock lock(slot.samples_mutex, std::try_to_lock);
    if (!lock.owns_lock()) return;

    if (!slot.samples.empty() && timestamp - slot.samples.back().time < sample_interval_) {
        return;
    }
    slot.samples.push_back({timestamp, cumulative});

    // Keep one sample at or before the window start as the speed baseline
    const auto window_start = timestamp - window_;
    while (slot.samples.size() > 1 && slot.samples[1].time <= window_start) {
        slot.samples.pop_front();
    }
}

void ProgressAggregator::reset_fragment(std::uint32_t index, Clock::time_point now) noexcept {
    if (index >= slot_count_) return;
    auto& slot = slots_[index];

    std::lock_guard lock(slot.samples_mutex);
    slot.bytes.store(0, std::memory_order_relaxed);
    slot.samples.clear();
    slot.samples.push_back({now, 0});
}

void ProgressAggregator::update_state(std::uint32_t index, FragmentState state) noexcept {
    if (index >= slot_count_) return;
    slots_[index].state.store(state, std::memory_order_release);
}

double ProgressAggregator::speed_of(Slot& slot, std::uint64_t bytes, Clock::time_point now) const {
    std::lock_guard lock(slot.samples_mutex);
    if (slot.samples.empty()) return 0.0;

    // Newest sample at or before the window start, else the oldest one
    const auto window_start = now - window_;
    const Sample* baseline = &slot.samples.front();
    for (const auto& sample : slot.samples) {
        if (sample.time > window_start) break;
        baseline = &sample;
    }

    const std::chrono::duration<double> span = now - baseline->time;
    if (span.count() <= 0.0 || bytes <= baseline->bytes) return 0.0;
    return static_cast<double>(bytes - baseline->bytes) / span.count();
}

ProgressSnapshot ProgressAggregator::snapshot(Clock::time_point now) const {
    ProgressSnapshot snap;

    std::lock_guard plan_lock(plan_mutex_);
    snap.fragments.reserve(slot_count_);

    std::uint64_t sum = 0;
    bool total_known = true;
    std::uint64_t total = 0;

    for (std::size_t i = 0; i < slot_count_; ++i) {
        auto& slot = slots_[i];

        FragmentProgress fp;
        fp.index = static_cast<std::uint32_t>(i);
        fp.bytes = slot.bytes.load(std::memory_order_relaxed);
        fp.state = slot.state.load(std::memory_order_acquire);
        fp.total = slot.total;
        fp.percent = percent_of(fp.bytes, fp.total, fp.state == FragmentState::completed);
        fp.speed = speed_of(slot, fp.bytes, now);

        sum += fp.bytes;
        snap.speed += fp.speed;
        if (fp.state == FragmentState::completed) ++snap.completed_fragments;
        if (fp.total) {
            total += *fp.total;
        } else {
            total_known = false;
        }
        snap.fragments.push_back(fp);
    }

    if (total_known && slot_count_ > 0) snap.bytes_total = total;

    {
        std::lock_guard hw_lock(high_water_mutex_);
        high_water_ = std::max(high_water_, sum);
        snap.bytes_downloaded = high_water_;
        snap.elapsed = now - started_;
    }

    const bool all_done = slot_count_ > 0 && snap.completed_fragments == slot_count_;
    snap.percent = percent_of(snap.bytes_downloaded, snap.bytes_total, all_done);
    return snap;
}

} // namespace fdm::core
