// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "record_decoders.hpp"

#include "field_decoder.hpp"
#include "peres_helpers.hpp"
#include "sample_decoder.hpp"

#include <algorithm>

namespace perfev {

namespace {

PERes decode_task(ByteCursor &cursor, TaskRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->ppid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->ptid));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->time));
  return {};
}

PERes decode_throttle_event(ByteCursor &cursor, ThrottleEvent *out) {
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->time));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->id));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->stream_id));
  return {};
}

} // namespace

PERes decode_mmap(const ParseConfig & /*config*/, uint16_t /*misc*/,
                  ByteCursor &cursor, MmapRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->addr));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->len));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->pgoff));
  // The name is NUL terminated. Anything after the terminator (padding or a
  // sample_id trailer) is not part of it.
  std::vector<std::byte> raw;
  PERES_CHECK_FWD_STRICT(read_remainder(cursor, &raw));
  auto const end = std::find(raw.begin(), raw.end(), std::byte{0});
  out->filename.assign(reinterpret_cast<const char *>(raw.data()),
                       static_cast<size_t>(end - raw.begin()));
  return {};
}

PERes decode_lost(const ParseConfig & /*config*/, uint16_t /*misc*/,
                  ByteCursor &cursor, LostRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->id));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->lost));
  return {};
}

PERes decode_comm(const ParseConfig & /*config*/, uint16_t /*misc*/,
                  ByteCursor &cursor, CommRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  PERES_CHECK_FWD_STRICT(read_string_remainder(cursor, &out->comm));
  return {};
}

PERes decode_exit(const ParseConfig & /*config*/, uint16_t /*misc*/,
                  ByteCursor &cursor, ExitRecord *out) {
  return decode_task(cursor, out);
}

PERes decode_fork(const ParseConfig & /*config*/, uint16_t /*misc*/,
                  ByteCursor &cursor, ForkRecord *out) {
  return decode_task(cursor, out);
}

PERes decode_throttle(const ParseConfig & /*config*/, uint16_t /*misc*/,
                      ByteCursor &cursor, ThrottleRecord *out) {
  return decode_throttle_event(cursor, out);
}

PERes decode_unthrottle(const ParseConfig & /*config*/, uint16_t /*misc*/,
                        ByteCursor &cursor, UnthrottleRecord *out) {
  return decode_throttle_event(cursor, out);
}

PERes decode_read(const ParseConfig &config, uint16_t /*misc*/,
                  ByteCursor &cursor, ReadRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  return decode_read_value(config, cursor, &out->values);
}

PERes decode_mmap2(const ParseConfig & /*config*/, uint16_t misc,
                   ByteCursor &cursor, Mmap2Record *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->addr));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->len));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->pgoff));
  out->has_build_id = (misc & PERF_RECORD_MISC_MMAP_BUILD_ID) != 0;
  if (out->has_build_id) {
    uint8_t reserved_1;
    uint16_t reserved_2;
    PERES_CHECK_FWD_STRICT(read_u8(cursor, &out->build_id_size));
    PERES_CHECK_FWD_STRICT(read_u8(cursor, &reserved_1));
    PERES_CHECK_FWD_STRICT(read_u16(cursor, &reserved_2));
    PERES_CHECK_FWD_STRICT(read_array(cursor, &out->build_id));
    out->build_id_size = std::min<uint8_t>(out->build_id_size,
                                           k_build_id_max_size);
    out->maj = 0;
    out->min = 0;
    out->ino = 0;
    out->ino_generation = 0;
  } else {
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->maj));
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->min));
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->ino));
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->ino_generation));
    out->build_id_size = 0;
    out->build_id = {};
  }
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->prot));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->flags));
  return read_string_remainder(cursor, &out->filename);
}

PERes decode_aux(const ParseConfig & /*config*/, uint16_t /*misc*/,
                 ByteCursor &cursor, AuxRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->aux_offset));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->aux_size));
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->flags));
  return {};
}

PERes decode_itrace_start(const ParseConfig & /*config*/, uint16_t /*misc*/,
                          ByteCursor &cursor, ITraceStartRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  return {};
}

PERes decode_lost_samples(const ParseConfig & /*config*/, uint16_t /*misc*/,
                          ByteCursor &cursor, LostSamplesRecord *out) {
  return read_u64(cursor, &out->lost);
}

PERes decode_switch(const ParseConfig & /*config*/, uint16_t misc,
                    ByteCursor & /*cursor*/, SwitchRecord *out) {
  out->switch_out = (misc & PERF_RECORD_MISC_SWITCH_OUT) != 0;
  return {};
}

PERes decode_switch_cpu_wide(const ParseConfig & /*config*/, uint16_t misc,
                             ByteCursor &cursor, SwitchCpuWideRecord *out) {
  out->switch_out = (misc & PERF_RECORD_MISC_SWITCH_OUT) != 0;
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->next_prev_pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->next_prev_tid));
  return {};
}

PERes decode_namespaces(const ParseConfig & /*config*/, uint16_t /*misc*/,
                        ByteCursor &cursor, NamespacesRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->pid));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->tid));
  uint64_t nr;
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &nr));
  if (unlikely(nr > cursor.remaining_len() / sizeof(NamespaceEntry))) {
    return peres_warn(PE_WHAT_EOD);
  }
  out->namespaces.resize(nr);
  for (NamespaceEntry &entry : out->namespaces) {
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &entry.dev));
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &entry.inode));
  }
  return {};
}

PERes decode_ksymbol(const ParseConfig & /*config*/, uint16_t /*misc*/,
                     ByteCursor &cursor, KSymbolRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->addr));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->len));
  PERES_CHECK_FWD_STRICT(read_u16(cursor, &out->ksym_type));
  PERES_CHECK_FWD_STRICT(read_u16(cursor, &out->flags));
  return read_string_remainder(cursor, &out->name);
}

PERes decode_bpf_event(const ParseConfig & /*config*/, uint16_t /*misc*/,
                       ByteCursor &cursor, BpfEventRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u16(cursor, &out->type));
  PERES_CHECK_FWD_STRICT(read_u16(cursor, &out->flags));
  PERES_CHECK_FWD_STRICT(read_u32(cursor, &out->id));
  return read_array(cursor, &out->tag);
}

PERes decode_cgroup(const ParseConfig & /*config*/, uint16_t /*misc*/,
                    ByteCursor &cursor, CgroupRecord *out) {
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->id));
  return read_string_remainder(cursor, &out->path);
}

PERes decode_text_poke(const ParseConfig & /*config*/, uint16_t /*misc*/,
                       ByteCursor &cursor, TextPokeRecord *out) {
  uint16_t old_len;
  uint16_t new_len;
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->addr));
  PERES_CHECK_FWD_STRICT(read_u16(cursor, &old_len));
  PERES_CHECK_FWD_STRICT(read_u16(cursor, &new_len));
  PERES_CHECK_FWD_STRICT(read_bytes(cursor, old_len, &out->old_bytes));
  PERES_CHECK_FWD_STRICT(read_bytes(cursor, new_len, &out->new_bytes));
  // bytes are padded to keep the record 8 bytes aligned
  if (unlikely(cursor.remaining_len() >= sizeof(uint64_t))) {
    return peres_warn(PE_WHAT_BAD_LENGTH);
  }
  return cursor.skip(cursor.remaining_len());
}

PERes decode_aux_output_hw_id(const ParseConfig & /*config*/,
                              uint16_t /*misc*/, ByteCursor &cursor,
                              AuxOutputHwIdRecord *out) {
  return read_u64(cursor, &out->hw_id);
}

PERes decode_unknown(const ParseConfig & /*config*/, uint16_t /*misc*/,
                     ByteCursor &cursor, UnknownRecord *out) {
  return read_remainder(cursor, &out->data);
}

} // namespace perfev
