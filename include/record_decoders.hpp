// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "parse_config.hpp"
#include "peres_def.hpp"
#include "record_types.hpp"

#include <cstdint>

// One decoder per record type. The cursor is bounded to the record body
// (header and sample_id trailer excluded). A decoder consumes the whole body
// on success; on failure the output is left unspecified.

namespace perfev {

PERes decode_mmap(const ParseConfig &config, uint16_t misc,
                  ByteCursor &cursor, MmapRecord *out);
PERes decode_lost(const ParseConfig &config, uint16_t misc,
                  ByteCursor &cursor, LostRecord *out);
PERes decode_comm(const ParseConfig &config, uint16_t misc,
                  ByteCursor &cursor, CommRecord *out);
PERes decode_exit(const ParseConfig &config, uint16_t misc,
                  ByteCursor &cursor, ExitRecord *out);
PERes decode_fork(const ParseConfig &config, uint16_t misc,
                  ByteCursor &cursor, ForkRecord *out);
PERes decode_throttle(const ParseConfig &config, uint16_t misc,
                      ByteCursor &cursor, ThrottleRecord *out);
PERes decode_unthrottle(const ParseConfig &config, uint16_t misc,
                        ByteCursor &cursor, UnthrottleRecord *out);
PERes decode_read(const ParseConfig &config, uint16_t misc,
                  ByteCursor &cursor, ReadRecord *out);
PERes decode_mmap2(const ParseConfig &config, uint16_t misc,
                   ByteCursor &cursor, Mmap2Record *out);
PERes decode_aux(const ParseConfig &config, uint16_t misc, ByteCursor &cursor,
                 AuxRecord *out);
PERes decode_itrace_start(const ParseConfig &config, uint16_t misc,
                          ByteCursor &cursor, ITraceStartRecord *out);
PERes decode_lost_samples(const ParseConfig &config, uint16_t misc,
                          ByteCursor &cursor, LostSamplesRecord *out);
PERes decode_switch(const ParseConfig &config, uint16_t misc,
                    ByteCursor &cursor, SwitchRecord *out);
PERes decode_switch_cpu_wide(const ParseConfig &config, uint16_t misc,
                             ByteCursor &cursor, SwitchCpuWideRecord *out);
PERes decode_namespaces(const ParseConfig &config, uint16_t misc,
                        ByteCursor &cursor, NamespacesRecord *out);
PERes decode_ksymbol(const ParseConfig &config, uint16_t misc,
                     ByteCursor &cursor, KSymbolRecord *out);
PERes decode_bpf_event(const ParseConfig &config, uint16_t misc,
                       ByteCursor &cursor, BpfEventRecord *out);
PERes decode_cgroup(const ParseConfig &config, uint16_t misc,
                    ByteCursor &cursor, CgroupRecord *out);
PERes decode_text_poke(const ParseConfig &config, uint16_t misc,
                       ByteCursor &cursor, TextPokeRecord *out);
PERes decode_aux_output_hw_id(const ParseConfig &config, uint16_t misc,
                              ByteCursor &cursor, AuxOutputHwIdRecord *out);
PERes decode_unknown(const ParseConfig &config, uint16_t misc,
                     ByteCursor &cursor, UnknownRecord *out);

} // namespace perfev
