// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <linux/perf_event.h>

namespace perfev {

/// Everything needed to decode the records of one perf counter.
/// Must match the perf_event_attr the counter was opened with.
struct ParseConfig {
  uint64_t sample_type{0};        // PERF_SAMPLE_* bits
  uint64_t read_format{0};        // PERF_FORMAT_* bits
  uint64_t branch_sample_type{0}; // PERF_SAMPLE_BRANCH_* bits
  uint64_t regs_user{0};          // sample_regs_user mask
  uint64_t regs_intr{0};          // sample_regs_intr mask
  bool sample_id_all{false};

  static ParseConfig from_attr(const perf_event_attr &attr);

  [[nodiscard]] bool has_sample(uint64_t sample_bit) const {
    return (sample_type & sample_bit) != 0;
  }
  [[nodiscard]] bool has_read_format(uint64_t format_bit) const {
    return (read_format & format_bit) != 0;
  }

  /// Length of the sample_id trailer appended to non-sample records
  /// (0 when sample_id_all is not set)
  [[nodiscard]] size_t sample_id_size() const;

  friend bool operator==(const ParseConfig &, const ParseConfig &) = default;
};

} // namespace perfev
