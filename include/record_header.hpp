// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>
#include <linux/perf_event.h>

namespace perfev {

/// Fixed prefix of every record in the ring buffer
struct RecordHeader {
  uint32_t type;
  uint16_t misc;
  uint16_t size; // includes the header itself
};

inline constexpr uint16_t k_record_header_size = 8;
static_assert(sizeof(RecordHeader) == k_record_header_size);
static_assert(sizeof(RecordHeader) == sizeof(perf_event_header));

} // namespace perfev
