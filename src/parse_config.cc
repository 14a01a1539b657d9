// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "parse_config.hpp"

#include <bit>

namespace perfev {

namespace {
// Sample bits that add one u64 to the sample_id trailer
constexpr uint64_t k_sample_id_bits = PERF_SAMPLE_TID | PERF_SAMPLE_TIME |
    PERF_SAMPLE_ID | PERF_SAMPLE_STREAM_ID | PERF_SAMPLE_CPU |
    PERF_SAMPLE_IDENTIFIER;
} // namespace

ParseConfig ParseConfig::from_attr(const perf_event_attr &attr) {
  ParseConfig config;
  config.sample_type = attr.sample_type;
  config.read_format = attr.read_format;
  config.branch_sample_type = attr.branch_sample_type;
  config.regs_user = attr.sample_regs_user;
  config.regs_intr = attr.sample_regs_intr;
  config.sample_id_all = attr.sample_id_all;
  return config;
}

size_t ParseConfig::sample_id_size() const {
  if (!sample_id_all) {
    return 0;
  }
  return std::popcount(sample_type & k_sample_id_bits) * sizeof(uint64_t);
}

} // namespace perfev
