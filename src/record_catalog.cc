// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "record_catalog.hpp"

#include "peres_helpers.hpp"
#include "record_decoders.hpp"
#include "sample_decoder.hpp"

#include <utility>

namespace perfev {

namespace {

template <typename T, PERes (*Decode)(const ParseConfig &, uint16_t,
                                      ByteCursor &, T *)>
PERes decode_event(const ParseConfig &config, uint16_t misc,
                   ByteCursor &cursor, RecordEvent *event) {
  T decoded{};
  PERES_CHECK_FWD_STRICT(Decode(config, misc, cursor, &decoded));
  *event = std::move(decoded);
  return {};
}

} // namespace

RecordDecodeFun record_decoder_for(uint32_t type) {
  switch (type) {
  case PERF_RECORD_MMAP:
    return decode_event<MmapRecord, decode_mmap>;
  case PERF_RECORD_LOST:
    return decode_event<LostRecord, decode_lost>;
  case PERF_RECORD_COMM:
    return decode_event<CommRecord, decode_comm>;
  case PERF_RECORD_EXIT:
    return decode_event<ExitRecord, decode_exit>;
  case PERF_RECORD_THROTTLE:
    return decode_event<ThrottleRecord, decode_throttle>;
  case PERF_RECORD_UNTHROTTLE:
    return decode_event<UnthrottleRecord, decode_unthrottle>;
  case PERF_RECORD_FORK:
    return decode_event<ForkRecord, decode_fork>;
  case PERF_RECORD_READ:
    return decode_event<ReadRecord, decode_read>;
  case PERF_RECORD_SAMPLE:
    return decode_event<Sample, decode_sample>;
  case PERF_RECORD_MMAP2:
    return decode_event<Mmap2Record, decode_mmap2>;
  case PERF_RECORD_AUX:
    return decode_event<AuxRecord, decode_aux>;
  case PERF_RECORD_ITRACE_START:
    return decode_event<ITraceStartRecord, decode_itrace_start>;
  case PERF_RECORD_LOST_SAMPLES:
    return decode_event<LostSamplesRecord, decode_lost_samples>;
  case PERF_RECORD_SWITCH:
    return decode_event<SwitchRecord, decode_switch>;
  case PERF_RECORD_SWITCH_CPU_WIDE:
    return decode_event<SwitchCpuWideRecord, decode_switch_cpu_wide>;
  case PERF_RECORD_NAMESPACES:
    return decode_event<NamespacesRecord, decode_namespaces>;
  case PERF_RECORD_KSYMBOL:
    return decode_event<KSymbolRecord, decode_ksymbol>;
  case PERF_RECORD_BPF_EVENT:
    return decode_event<BpfEventRecord, decode_bpf_event>;
  case PERF_RECORD_CGROUP:
    return decode_event<CgroupRecord, decode_cgroup>;
  case PERF_RECORD_TEXT_POKE:
    return decode_event<TextPokeRecord, decode_text_poke>;
  case PERF_RECORD_AUX_OUTPUT_HW_ID:
    return decode_event<AuxOutputHwIdRecord, decode_aux_output_hw_id>;
  default:
    return decode_event<UnknownRecord, decode_unknown>;
  }
}

bool is_known_record_type(uint32_t type) {
  return type >= PERF_RECORD_MMAP && type <= PERF_RECORD_AUX_OUTPUT_HW_ID;
}

const char *record_type_str(uint32_t type) {
  switch (type) {
  case PERF_RECORD_MMAP:
    return "MMAP";
  case PERF_RECORD_LOST:
    return "LOST";
  case PERF_RECORD_COMM:
    return "COMM";
  case PERF_RECORD_EXIT:
    return "EXIT";
  case PERF_RECORD_THROTTLE:
    return "THROTTLE";
  case PERF_RECORD_UNTHROTTLE:
    return "UNTHROTTLE";
  case PERF_RECORD_FORK:
    return "FORK";
  case PERF_RECORD_READ:
    return "READ";
  case PERF_RECORD_SAMPLE:
    return "SAMPLE";
  case PERF_RECORD_MMAP2:
    return "MMAP2";
  case PERF_RECORD_AUX:
    return "AUX";
  case PERF_RECORD_ITRACE_START:
    return "ITRACE_START";
  case PERF_RECORD_LOST_SAMPLES:
    return "LOST_SAMPLES";
  case PERF_RECORD_SWITCH:
    return "SWITCH";
  case PERF_RECORD_SWITCH_CPU_WIDE:
    return "SWITCH_CPU_WIDE";
  case PERF_RECORD_NAMESPACES:
    return "NAMESPACES";
  case PERF_RECORD_KSYMBOL:
    return "KSYMBOL";
  case PERF_RECORD_BPF_EVENT:
    return "BPF_EVENT";
  case PERF_RECORD_CGROUP:
    return "CGROUP";
  case PERF_RECORD_TEXT_POKE:
    return "TEXT_POKE";
  case PERF_RECORD_AUX_OUTPUT_HW_ID:
    return "AUX_OUTPUT_HW_ID";
  default:
    return "UNKNOWN";
  }
}

bool record_type_has_sample_id(uint32_t type) {
  // MMAP names are NUL terminated, the decoder ignores what follows
  return type != PERF_RECORD_SAMPLE && type != PERF_RECORD_MMAP;
}

PERes decode_record(const ParseConfig &config, const RecordHeader &header,
                    ByteCursor body, Record *out) {
  out->type = header.type;
  out->misc = header.misc;
  out->sample_id = {};

  ByteCursor trailer;
  if (record_type_has_sample_id(header.type) && config.sample_id_all) {
    size_t const trailer_len = config.sample_id_size();
    if (unlikely(body.remaining_len() < trailer_len)) {
      return peres_warn(PE_WHAT_BAD_LENGTH);
    }
    size_t const body_len = body.remaining_len() - trailer_len;
    trailer = body;
    PERES_CHECK_FWD_STRICT(trailer.skip(body_len));
    PERES_CHECK_FWD_STRICT(body.truncate(body_len));
  }

  RecordDecodeFun const decode = record_decoder_for(header.type);
  PERES_CHECK_FWD_STRICT(decode(config, header.misc, body, &out->event));
  if (unlikely(!body.empty())) {
    // the body holds more than its fields
    return peres_warn(PE_WHAT_BAD_LENGTH);
  }

  if (header.type == PERF_RECORD_SAMPLE) {
    out->sample_id = SampleId::from_sample(std::get<Sample>(out->event));
    return {};
  }
  if (record_type_has_sample_id(header.type)) {
    PERES_CHECK_FWD_STRICT(decode_sample_id(config, trailer, &out->sample_id));
  }
  return {};
}

PERes decode_record_sample_id(const ParseConfig &config,
                              const RecordHeader &header, ByteCursor body,
                              SampleId *out) {
  *out = {};
  if (header.type == PERF_RECORD_SAMPLE) {
    Sample sample;
    PERES_CHECK_FWD_STRICT(decode_sample(config, header.misc, body, &sample));
    *out = SampleId::from_sample(sample);
    return {};
  }
  if (!record_type_has_sample_id(header.type) || !config.sample_id_all) {
    return {};
  }
  size_t const trailer_len = config.sample_id_size();
  if (unlikely(body.remaining_len() < trailer_len)) {
    return peres_warn(PE_WHAT_BAD_LENGTH);
  }
  PERES_CHECK_FWD_STRICT(body.skip(body.remaining_len() - trailer_len));
  return decode_sample_id(config, body, out);
}

} // namespace perfev
