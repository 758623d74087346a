// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/cancel.hpp>
#include <condition_variable>
#include <mutex>

namespace fdm::core {

bool sleep_for(std::stop_token stop, std::chrono::milliseconds duration) {
    if (stop.stop_requested()) return false;
    if (duration <= std::chrono::milliseconds::zero()) return true;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    // The stop_token overload registers a stop callback that wakes the wait
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

} // namespace fdm::core
