// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "parse_config.hpp"
#include "peres_def.hpp"

#include <cstdint>
#include <optional>

namespace perfev {

struct Sample;

/// Identification fields attached to records when sample_id_all is set
struct SampleId {
  std::optional<uint32_t> pid;
  std::optional<uint32_t> tid;
  std::optional<uint64_t> time;
  // PERF_SAMPLE_IDENTIFIER overrides PERF_SAMPLE_ID
  std::optional<uint64_t> id;
  std::optional<uint64_t> stream_id;
  std::optional<uint32_t> cpu;

  /// Samples carry no trailer, the same fields are taken from the sample
  static SampleId from_sample(const Sample &sample);

  friend bool operator==(const SampleId &, const SampleId &) = default;
};

/// Decode a trailer of exactly config.sample_id_size() bytes.
/// Leaves `out` empty when sample_id_all is not set.
PERes decode_sample_id(const ParseConfig &config, ByteCursor &cursor,
                       SampleId *out);

} // namespace perfev
