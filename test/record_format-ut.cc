// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "record_format.hpp"

namespace perfev {

TEST(RecordFormat, Comm) {
  Record record;
  record.type = PERF_RECORD_COMM;
  record.misc = PERF_RECORD_MISC_USER;
  record.event = CommRecord{.pid = 12, .tid = 13, .comm = "bash"};
  record.sample_id.time = 99;
  EXPECT_EQ(to_string(record),
            "COMM misc=0x2 cpumode=USER pid=12 tid=13 comm=bash "
            "sample_id={time=99}");
}

TEST(RecordFormat, SampleOnlyPresentFields) {
  Sample sample;
  sample.ip = 0x401000;
  sample.tid = 7;
  sample.callchain = std::vector<uint64_t>{0x10, 0x20};
  EXPECT_EQ(to_string(sample), " ip=0x401000 tid=7 callchain=[0x10,0x20]");
}

TEST(RecordFormat, ReadValue) {
  ReadValue value;
  value.group = true;
  value.time_enabled = 10;
  value.entries.push_back({.value = 5, .id = 1, .lost = std::nullopt});
  value.entries.push_back({.value = 6, .id = 2, .lost = std::nullopt});
  EXPECT_EQ(to_string(value), "group{enabled=10 values=[5(id=1),6(id=2)]}");
}

TEST(RecordFormat, Unknown) {
  Record record;
  record.type = 77;
  record.event = UnknownRecord{.data = std::vector<std::byte>(16)};
  EXPECT_EQ(to_string(record), "UNKNOWN misc=0 cpumode=UNKNOWN type=77 size=16");
}

} // namespace perfev
