// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "peres_def.hpp"

#include <cstdint>
#include <linux/perf_event.h>
#include <optional>

namespace perfev {

/// Counter state read from the metadata page without a syscall
struct UserReadData {
  uint64_t time_enabled{0}; // ns
  uint64_t time_running{0}; // ns
  // set when the hardware counter could be read from user space
  std::optional<uint64_t> count;

  /// count extrapolated to time_enabled (multiplexing compensation)
  [[nodiscard]] std::optional<uint64_t> scaled_count() const;
};

/// Sources of the values that are not in the metadata page
struct UserReadHooks {
  // read hardware counter `idx` (rdpmc on x86)
  uint64_t (*read_pmc)(uint32_t idx);
  // read the time stamp counter (rdtsc on x86)
  uint64_t (*read_tsc)();
};

/// Hooks for the host architecture (null members where unsupported)
UserReadHooks host_user_read_hooks();

inline constexpr int k_user_read_max_attempts = 1000;

/// Read the counter through the metadata page seqlock. The whole read is
/// retried while the kernel updates the page, up to
/// k_user_read_max_attempts times (PE_WHAT_USERREAD warning after that).
PERes read_user(const perf_event_mmap_page *page, UserReadData *out);

/// Same as above with explicit hooks
PERes read_user(const perf_event_mmap_page *page, const UserReadHooks &hooks,
                UserReadData *out);

} // namespace perfev
