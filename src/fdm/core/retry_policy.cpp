// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/retry_policy.hpp>
#include <algorithm>
#include <cmath>

namespace {

// Upper bound for an uncapped delay; keeps the double -> integer conversion defined
constexpr double SATURATED_DELAY_MS = 365.0 * 24 * 3600 * 1000;

} // namespace

namespace fdm::core {

RetryPolicy::RetryPolicy(std::uint32_t max_attempts,
                         std::chrono::milliseconds base_delay,
                         double multiplier,
                         std::chrono::milliseconds max_delay,
                         std::chrono::milliseconds jitter) noexcept
    : max_attempts_(max_attempts)
    , base_delay_(base_delay)
    , multiplier_(multiplier)
    , max_delay_(max_delay)
    , jitter_(jitter) {}

RetryPolicy RetryPolicy::from_config(const DownloadConfig& config) noexcept {
    return RetryPolicy(config.retry_attempts,
                       std::chrono::milliseconds(config.retry_base_delay_ms),
                       config.retry_backoff_multiplier,
                       std::chrono::milliseconds(config.retry_max_delay_ms),
                       std::chrono::milliseconds(config.retry_jitter_ms));
}

std::chrono::milliseconds RetryPolicy::delay(std::uint32_t attempt) const noexcept {
    if (attempt == 0) attempt = 1;

    const double base = static_cast<double>(base_delay_.count());
    double raw = base * std::pow(multiplier_, static_cast<double>(attempt - 1));

    if (max_delay_.count() > 0) {
        raw = std::min(raw, static_cast<double>(max_delay_.count()));
    }
    // pow overflows to inf for large attempts
    raw = std::min(raw, SATURATED_DELAY_MS);
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(raw));
}

std::chrono::milliseconds RetryPolicy::delay(std::uint32_t attempt, double unit_random) const noexcept {
    unit_random = std::clamp(unit_random, 0.0, 1.0);
    auto extra = static_cast<std::chrono::milliseconds::rep>(
        unit_random * static_cast<double>(jitter_.count()));
    return delay(attempt) + std::chrono::milliseconds(extra);
}

bool RetryPolicy::should_retry(std::uint32_t attempt, const std::error_code& ec) const noexcept {
    return is_retryable(ec) && attempt < max_attempts_;
}

} // namespace fdm::core
