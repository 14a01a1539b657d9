// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sample_id.hpp"

#include "field_decoder.hpp"
#include "peres_helpers.hpp"
#include "sample.hpp"

namespace perfev {

SampleId SampleId::from_sample(const Sample &sample) {
  SampleId sample_id;
  sample_id.pid = sample.pid;
  sample_id.tid = sample.tid;
  sample_id.time = sample.time;
  sample_id.id = sample.id;
  sample_id.stream_id = sample.stream_id;
  sample_id.cpu = sample.cpu;
  return sample_id;
}

PERes decode_sample_id(const ParseConfig &config, ByteCursor &cursor,
                       SampleId *out) {
  *out = {};
  if (!config.sample_id_all) {
    return {};
  }
  if (config.has_sample(PERF_SAMPLE_TID)) {
    uint32_t pid;
    uint32_t tid;
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &pid));
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &tid));
    out->pid = pid;
    out->tid = tid;
  }
  if (config.has_sample(PERF_SAMPLE_TIME)) {
    uint64_t time;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &time));
    out->time = time;
  }
  if (config.has_sample(PERF_SAMPLE_ID)) {
    uint64_t id;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &id));
    out->id = id;
  }
  if (config.has_sample(PERF_SAMPLE_STREAM_ID)) {
    uint64_t stream_id;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &stream_id));
    out->stream_id = stream_id;
  }
  if (config.has_sample(PERF_SAMPLE_CPU)) {
    uint32_t cpu;
    uint32_t res;
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &cpu));
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &res));
    out->cpu = cpu;
  }
  if (config.has_sample(PERF_SAMPLE_IDENTIFIER)) {
    uint64_t identifier;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &identifier));
    out->id = identifier;
  }
  return {};
}

} // namespace perfev
