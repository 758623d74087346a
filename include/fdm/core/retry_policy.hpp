// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <system_error>

namespace fdm::core {

// Exponential backoff: delay(k) = base * multiplier^(k-1) + jitter,
// bounded by max_delay when one is set
class RetryPolicy {
public:
    RetryPolicy() = default;
    RetryPolicy(std::uint32_t max_attempts,
                std::chrono::milliseconds base_delay,
                double multiplier,
                std::chrono::milliseconds max_delay,
                std::chrono::milliseconds jitter = std::chrono::milliseconds::zero()) noexcept;

    [[nodiscard]] static RetryPolicy from_config(const DownloadConfig& config) noexcept;

    // Delay before re-issuing after failed attempt `attempt` (1-based), without jitter
    [[nodiscard]] std::chrono::milliseconds delay(std::uint32_t attempt) const noexcept;

    // Same, perturbed by unit_random * jitter (unit_random in [0, 1))
    [[nodiscard]] std::chrono::milliseconds delay(std::uint32_t attempt, double unit_random) const noexcept;

    // True if `ec` is transient and another request is allowed after `attempt` requests
    [[nodiscard]] bool should_retry(std::uint32_t attempt, const std::error_code& ec) const noexcept;

    [[nodiscard]] std::uint32_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] double multiplier() const noexcept { return multiplier_; }
    [[nodiscard]] std::chrono::milliseconds max_delay() const noexcept { return max_delay_; }
    [[nodiscard]] std::chrono::milliseconds jitter() const noexcept { return jitter_; }

private:
    std::uint32_t max_attempts_{DEFAULT_RETRY_ATTEMPTS};
    std::chrono::milliseconds base_delay_{DEFAULT_RETRY_BASE_DELAY_MS};
    double multiplier_{DEFAULT_RETRY_BACKOFF};
    std::chrono::milliseconds max_delay_{DEFAULT_RETRY_MAX_DELAY_MS};
    std::chrono::milliseconds jitter_{0};
};

} // namespace fdm::core
