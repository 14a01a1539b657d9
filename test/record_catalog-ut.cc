// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "loghandle.hpp"
#include "peres.hpp"
#include "record_builder.hpp"
#include "record_catalog.hpp"

#include <cstring>

namespace perfev {

namespace {
ParseConfig sample_id_config() {
  ParseConfig config;
  config.sample_type = PERF_SAMPLE_IP | PERF_SAMPLE_TID | PERF_SAMPLE_TIME |
      PERF_SAMPLE_CPU | PERF_SAMPLE_IDENTIFIER;
  config.sample_id_all = true;
  return config;
}

// trailer for sample_id_config()
void add_sample_id(RecordBuilder &builder) {
  builder.add_u32(300).add_u32(301); // pid, tid
  builder.add_u64(5000);             // time
  builder.add_u32(2).add_u32(0);     // cpu, res
  builder.add_u64(0xab);             // identifier
}

RecordHeader header_for(uint32_t type, const RecordBuilder &builder,
                        uint16_t misc = 0) {
  return {.type = type,
          .misc = misc,
          .size = static_cast<uint16_t>(k_record_header_size +
                                        builder.size())};
}
} // namespace

TEST(RecordCatalog, Names) {
  EXPECT_STREQ(record_type_str(PERF_RECORD_SAMPLE), "SAMPLE");
  EXPECT_STREQ(record_type_str(PERF_RECORD_TEXT_POKE), "TEXT_POKE");
  EXPECT_STREQ(record_type_str(1000), "UNKNOWN");
  EXPECT_TRUE(is_known_record_type(PERF_RECORD_AUX_OUTPUT_HW_ID));
  EXPECT_FALSE(is_known_record_type(0));
  EXPECT_FALSE(is_known_record_type(PERF_RECORD_MAX));
  EXPECT_FALSE(record_type_has_sample_id(PERF_RECORD_SAMPLE));
  EXPECT_FALSE(record_type_has_sample_id(PERF_RECORD_MMAP));
  EXPECT_TRUE(record_type_has_sample_id(PERF_RECORD_COMM));
}

TEST(RecordCatalog, CommWithSampleId) {
  RecordBuilder builder;
  builder.add_u32(300).add_u32(301).add_string("worker");
  add_sample_id(builder);

  ParseConfig const config = sample_id_config();
  Record record;
  ASSERT_TRUE(IsPEResOK(decode_record(
      config, header_for(PERF_RECORD_COMM, builder, PERF_RECORD_MISC_COMM_EXEC),
      builder.cursor(), &record)));
  EXPECT_EQ(record.type, PERF_RECORD_COMM);
  EXPECT_TRUE(record.has_misc(PERF_RECORD_MISC_COMM_EXEC));
  const CommRecord *comm = record.get_if<CommRecord>();
  ASSERT_NE(comm, nullptr);
  EXPECT_EQ(comm->comm, "worker");
  EXPECT_EQ(record.sample_id.pid, 300);
  EXPECT_EQ(record.sample_id.tid, 301);
  EXPECT_EQ(record.sample_id.time, 5000);
  EXPECT_EQ(record.sample_id.cpu, 2);
  EXPECT_EQ(record.sample_id.id, 0xab);
  EXPECT_FALSE(record.sample_id.stream_id);

  SampleId sample_id;
  ASSERT_TRUE(IsPEResOK(decode_record_sample_id(
      config, header_for(PERF_RECORD_COMM, builder), builder.cursor(),
      &sample_id)));
  EXPECT_EQ(sample_id, record.sample_id);
}

TEST(RecordCatalog, SwitchWithSampleId) {
  RecordBuilder builder;
  add_sample_id(builder);
  Record record;
  ASSERT_TRUE(IsPEResOK(decode_record(
      sample_id_config(),
      header_for(PERF_RECORD_SWITCH, builder, PERF_RECORD_MISC_SWITCH_OUT),
      builder.split_cursor(9), &record)));
  ASSERT_NE(record.get_if<SwitchRecord>(), nullptr);
  EXPECT_TRUE(record.get_if<SwitchRecord>()->switch_out);
  EXPECT_EQ(record.sample_id.time, 5000);
}

TEST(RecordCatalog, SampleIdFromSample) {
  ParseConfig const config = sample_id_config();
  RecordBuilder builder;
  builder.add_u64(0xab);             // identifier
  builder.add_u64(0x401000);         // ip
  builder.add_u32(300).add_u32(301); // pid, tid
  builder.add_u64(5000);             // time
  builder.add_u32(2).add_u32(0);     // cpu, res
  Record record;
  ASSERT_TRUE(IsPEResOK(decode_record(
      config,
      header_for(PERF_RECORD_SAMPLE, builder,
                 PERF_RECORD_MISC_USER | PERF_RECORD_MISC_EXACT_IP),
      builder.cursor(), &record)));
  EXPECT_EQ(record.cpumode(), CpuMode::kUser);
  EXPECT_TRUE(record.exact_ip());
  const Sample *sample = record.get_if<Sample>();
  ASSERT_NE(sample, nullptr);
  EXPECT_EQ(sample->ip, 0x401000);
  EXPECT_EQ(record.sample_id.id, 0xab);
  EXPECT_EQ(record.sample_id.cpu, 2);

  SampleId sample_id;
  ASSERT_TRUE(IsPEResOK(decode_record_sample_id(
      config, header_for(PERF_RECORD_SAMPLE, builder), builder.cursor(),
      &sample_id)));
  EXPECT_EQ(sample_id, record.sample_id);
}

TEST(RecordCatalog, MmapHasNoSampleId) {
  RecordBuilder builder;
  builder.add_u32(1).add_u32(1).add_u64(0x1000).add_u64(0x1000).add_u64(0);
  builder.add_string("/lib/x.so");
  add_sample_id(builder);
  Record record;
  ASSERT_TRUE(IsPEResOK(decode_record(sample_id_config(),
                                      header_for(PERF_RECORD_MMAP, builder),
                                      builder.cursor(), &record)));
  EXPECT_EQ(record.get_if<MmapRecord>()->filename, "/lib/x.so");
  EXPECT_EQ(record.sample_id, SampleId{});
}

TEST(RecordCatalog, UnknownType) {
  RecordBuilder builder;
  builder.add_u64(1).add_u64(2);
  Record record;
  ASSERT_TRUE(IsPEResOK(decode_record(sample_id_config(),
                                      header_for(4242, builder),
                                      builder.cursor(), &record)));
  const UnknownRecord *unknown = record.get_if<UnknownRecord>();
  ASSERT_NE(unknown, nullptr);
  EXPECT_EQ(unknown->data, builder.body());
}

TEST(RecordCatalog, LeftoverBytes) {
  LogHandle handle(LL_ERROR);
  RecordBuilder builder;
  builder.add_u64(7).add_u64(9).add_u64(0xdead);
  Record record;
  PERes const res = decode_record({}, header_for(PERF_RECORD_LOST, builder),
                                  builder.cursor(), &record);
  EXPECT_EQ(res, peres_warn(PE_WHAT_BAD_LENGTH));
}

TEST(RecordCatalog, TrailerLargerThanBody) {
  LogHandle handle(LL_ERROR);
  RecordBuilder builder;
  builder.add_u64(1);
  Record record;
  EXPECT_EQ(decode_record(sample_id_config(),
                          header_for(PERF_RECORD_LOST_SAMPLES, builder),
                          builder.cursor(), &record),
            peres_warn(PE_WHAT_BAD_LENGTH));
}

} // namespace perfev
