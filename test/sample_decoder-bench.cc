// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <benchmark/benchmark.h>

#include <bit>

#include "record_builder.hpp"
#include "sample_decoder.hpp"

namespace perfev {

namespace {
ParseConfig profiling_config() {
  ParseConfig config;
  config.sample_type = PERF_SAMPLE_IDENTIFIER | PERF_SAMPLE_IP |
      PERF_SAMPLE_TID | PERF_SAMPLE_TIME | PERF_SAMPLE_PERIOD |
      PERF_SAMPLE_CALLCHAIN | PERF_SAMPLE_REGS_USER | PERF_SAMPLE_STACK_USER;
  config.regs_user = k_perf_register_mask;
  return config;
}

RecordBuilder profiling_sample(const ParseConfig &config) {
  RecordBuilder builder;
  builder.add_u64(1).add_u64(0x401000).add_u32(10).add_u32(10);
  builder.add_u64(123456).add_u64(1000000);
  builder.add_u64(32);
  for (uint64_t i = 0; i < 32; ++i) {
    builder.add_u64(0x401000 + i * 16);
  }
  builder.add_u64(PERF_SAMPLE_REGS_ABI_64);
  for (int i = 0; i < std::popcount(config.regs_user); ++i) {
    builder.add_u64(0x7ffc0000 + i);
  }
  constexpr uint64_t k_stack_size = 16384;
  builder.add_u64(k_stack_size);
  for (uint64_t i = 0; i < k_stack_size / sizeof(uint64_t); ++i) {
    builder.add_u64(i);
  }
  builder.add_u64(k_stack_size);
  return builder;
}
} // namespace

static void BM_decode_sample(benchmark::State &state) {
  ParseConfig const config = profiling_config();
  RecordBuilder const builder = profiling_sample(config);
  Sample sample;
  for (auto _ : state) {
    ByteCursor cursor = builder.cursor();
    PERes res = decode_sample(config, 0, cursor, &sample);
    benchmark::DoNotOptimize(res);
  }
}

BENCHMARK(BM_decode_sample);

static void BM_decode_sample_split(benchmark::State &state) {
  ParseConfig const config = profiling_config();
  RecordBuilder const builder = profiling_sample(config);
  Sample sample;
  for (auto _ : state) {
    // wrap point in the middle of the user stack
    ByteCursor cursor = builder.split_cursor(builder.size() / 2 + 3);
    PERes res = decode_sample(config, 0, cursor, &sample);
    benchmark::DoNotOptimize(res);
  }
}

BENCHMARK(BM_decode_sample_split);

} // namespace perfev

BENCHMARK_MAIN();
