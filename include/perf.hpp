// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "peres_def.hpp"
#include "unique_fd.hpp"

#include <cstddef>
#include <linux/perf_event.h>
#include <sys/types.h>
#include <utility>

namespace perfev {

long get_page_size();

int perf_event_open(struct perf_event_attr *attr, pid_t pid, int cpu, int gfd,
                    unsigned long flags);

/// Open a counter, the descriptor is closed on exec
PERes perf_event_open_fd(struct perf_event_attr *attr, pid_t pid, int cpu,
                         UniqueFd *fd);

/// Mapping size for a data area of 2^buf_size_shift pages plus the metadata
/// page
size_t perf_mmap_size(int buf_size_shift);

/// Owns the memory mapping of a perf counter ring buffer
class PerfMapping {
public:
  PerfMapping() = default;
  ~PerfMapping();

  PerfMapping(PerfMapping &&other) noexcept { swap(*this, other); }
  PerfMapping &operator=(PerfMapping &&other) noexcept {
    swap(*this, other);
    return *this;
  }

  PerfMapping(const PerfMapping &) = delete;
  PerfMapping &operator=(const PerfMapping &) = delete;

  /// Map `size` bytes of the counter `fd`, see perf_mmap_size
  static PERes map(int fd, size_t size, PerfMapping *mapping);

  [[nodiscard]] void *get_region() const { return _region; }
  [[nodiscard]] size_t get_sz() const { return _sz; }

private:
  static void swap(PerfMapping &first, PerfMapping &second) noexcept {
    std::swap(first._region, second._region);
    std::swap(first._sz, second._sz);
  }

  void *_region{nullptr};
  size_t _sz{0};
};

} // namespace perfev
