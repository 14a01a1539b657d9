// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "clocks.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace perfev {

/// Lets through at most N events per interval.
/// The clock is only read once the budget of the current interval is spent.
class IntervalRateLimiter {
public:
  IntervalRateLimiter(uint64_t max_count_per_interval,
                      std::chrono::nanoseconds interval) noexcept
      : _max_count_per_interval(max_count_per_interval), _interval(interval) {}

  bool check() {
    auto old_count = _count.fetch_add(1, std::memory_order_acq_rel);
    if (old_count < _max_count_per_interval) {
      return true;
    }
    return check_slow();
  }

private:
  bool check_slow() noexcept;

  uint64_t _max_count_per_interval;
  std::chrono::nanoseconds _interval;
  // Starts saturated so that the first check opens the first interval
  std::atomic<uint64_t> _count{std::numeric_limits<uint64_t>::max() / 2};
  std::atomic<CoarseMonotonicClock::time_point> _interval_end{};
};

} // namespace perfev
