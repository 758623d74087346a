// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <stop_token>

namespace fdm::core {

// Block for `duration` unless `stop` fires first.
// Returns true if the full duration elapsed, false if woken by a stop request.
bool sleep_for(std::stop_token stop, std::chrono::milliseconds duration);

} // namespace fdm::core
