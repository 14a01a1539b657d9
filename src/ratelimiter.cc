// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "ratelimiter.hpp"

namespace perfev {

bool IntervalRateLimiter::check_slow() noexcept {
  auto now = CoarseMonotonicClock::now();
  auto interval_end = _interval_end.load(std::memory_order_acquire);
  if (now < interval_end) {
    return false;
  }
  // Only one caller opens the next interval, the others are limited
  if (!_interval_end.compare_exchange_strong(interval_end, now + _interval,
                                             std::memory_order_acq_rel)) {
    return false;
  }
  _count.store(1, std::memory_order_release);
  return _max_count_per_interval > 0;
}

} // namespace perfev
