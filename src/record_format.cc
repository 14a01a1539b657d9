// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "record_format.hpp"

#include "record_catalog.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include <variant>

namespace perfev {

namespace {

template <typename T>
void append_opt(std::string &out, const char *name,
                const std::optional<T> &value) {
  if (value) {
    absl::StrAppendFormat(&out, " %s=%d", name, *value);
  }
}

void append_opt_hex(std::string &out, const char *name,
                    const std::optional<uint64_t> &value) {
  if (value) {
    absl::StrAppendFormat(&out, " %s=%#x", name, *value);
  }
}

void append_registers(std::string &out, const char *name,
                      const Registers &regs) {
  absl::StrAppendFormat(&out, " %s={abi=%d mask=%#x regs=[%s]}", name,
                        regs.abi, regs.mask,
                        absl::StrJoin(regs.regs, ",", [](std::string *o,
                                                          uint64_t v) {
                          absl::StrAppendFormat(o, "%#x", v);
                        }));
}

void append_event(std::string &out, const UnknownRecord &rec) {
  absl::StrAppendFormat(&out, " size=%d", rec.data.size());
}

void append_event(std::string &out, const MmapRecord &rec) {
  absl::StrAppendFormat(&out, " pid=%d tid=%d addr=%#x len=%#x pgoff=%#x %s",
                        rec.pid, rec.tid, rec.addr, rec.len, rec.pgoff,
                        rec.filename);
}

void append_event(std::string &out, const LostRecord &rec) {
  absl::StrAppendFormat(&out, " id=%d lost=%d", rec.id, rec.lost);
}

void append_event(std::string &out, const CommRecord &rec) {
  absl::StrAppendFormat(&out, " pid=%d tid=%d comm=%s", rec.pid, rec.tid,
                        rec.comm);
}

void append_event(std::string &out, const TaskRecord &rec) {
  absl::StrAppendFormat(&out, " pid=%d ppid=%d tid=%d ptid=%d time=%d",
                        rec.pid, rec.ppid, rec.tid, rec.ptid, rec.time);
}

void append_event(std::string &out, const ThrottleEvent &rec) {
  absl::StrAppendFormat(&out, " time=%d id=%d stream_id=%d", rec.time, rec.id,
                        rec.stream_id);
}

void append_event(std::string &out, const ReadRecord &rec) {
  absl::StrAppendFormat(&out, " pid=%d tid=%d %s", rec.pid, rec.tid,
                        to_string(rec.values));
}

void append_event(std::string &out, const Sample &rec) {
  absl::StrAppend(&out, to_string(rec));
}

void append_event(std::string &out, const Mmap2Record &rec) {
  absl::StrAppendFormat(&out, " pid=%d tid=%d addr=%#x len=%#x pgoff=%#x",
                        rec.pid, rec.tid, rec.addr, rec.len, rec.pgoff);
  if (rec.has_build_id) {
    absl::StrAppend(&out, " build_id=");
    for (size_t i = 0; i < rec.build_id_size; ++i) {
      absl::StrAppendFormat(&out, "%02x",
                            static_cast<unsigned>(rec.build_id[i]));
    }
  } else {
    absl::StrAppendFormat(&out, " maj=%d min=%d ino=%d ino_generation=%d",
                          rec.maj, rec.min, rec.ino, rec.ino_generation);
  }
  absl::StrAppendFormat(&out, " prot=%#x flags=%#x %s", rec.prot, rec.flags,
                        rec.filename);
}

void append_event(std::string &out, const AuxRecord &rec) {
  absl::StrAppendFormat(&out, " aux_offset=%#x aux_size=%d flags=%#x",
                        rec.aux_offset, rec.aux_size, rec.flags);
}

void append_event(std::string &out, const ITraceStartRecord &rec) {
  absl::StrAppendFormat(&out, " pid=%d tid=%d", rec.pid, rec.tid);
}

void append_event(std::string &out, const LostSamplesRecord &rec) {
  absl::StrAppendFormat(&out, " lost=%d", rec.lost);
}

void append_event(std::string &out, const SwitchRecord &rec) {
  absl::StrAppend(&out, rec.switch_out ? " out" : " in");
}

void append_event(std::string &out, const SwitchCpuWideRecord &rec) {
  absl::StrAppendFormat(&out, " %s next_prev_pid=%d next_prev_tid=%d",
                        rec.switch_out ? "out" : "in", rec.next_prev_pid,
                        rec.next_prev_tid);
}

void append_event(std::string &out, const NamespacesRecord &rec) {
  absl::StrAppendFormat(&out, " pid=%d tid=%d namespaces=[", rec.pid, rec.tid);
  for (const NamespaceEntry &entry : rec.namespaces) {
    absl::StrAppendFormat(&out, "{dev=%d inode=%d}", entry.dev, entry.inode);
  }
  absl::StrAppend(&out, "]");
}

void append_event(std::string &out, const KSymbolRecord &rec) {
  absl::StrAppendFormat(&out, " addr=%#x len=%d type=%d flags=%#x %s",
                        rec.addr, rec.len, rec.ksym_type, rec.flags, rec.name);
}

void append_event(std::string &out, const BpfEventRecord &rec) {
  absl::StrAppendFormat(&out, " type=%d flags=%#x id=%d tag=", rec.type,
                        rec.flags, rec.id);
  for (std::byte b : rec.tag) {
    absl::StrAppendFormat(&out, "%02x", static_cast<unsigned>(b));
  }
}

void append_event(std::string &out, const CgroupRecord &rec) {
  absl::StrAppendFormat(&out, " id=%d path=%s", rec.id, rec.path);
}

void append_event(std::string &out, const TextPokeRecord &rec) {
  absl::StrAppendFormat(&out, " addr=%#x old_len=%d new_len=%d", rec.addr,
                        rec.old_bytes.size(), rec.new_bytes.size());
}

void append_event(std::string &out, const AuxOutputHwIdRecord &rec) {
  absl::StrAppendFormat(&out, " hw_id=%#x", rec.hw_id);
}

} // namespace

const char *cpumode_str(CpuMode mode) {
  switch (mode) {
  case CpuMode::kUnknown:
    return "UNKNOWN";
  case CpuMode::kKernel:
    return "KERNEL";
  case CpuMode::kUser:
    return "USER";
  case CpuMode::kHypervisor:
    return "HYPERVISOR";
  case CpuMode::kGuestKernel:
    return "GUEST_KERNEL";
  case CpuMode::kGuestUser:
    return "GUEST_USER";
  }
  return "UNKNOWN";
}

std::string to_string(const ReadValue &value) {
  std::string out = value.group ? "group{" : "{";
  if (value.time_enabled) {
    absl::StrAppendFormat(&out, "enabled=%d ", *value.time_enabled);
  }
  if (value.time_running) {
    absl::StrAppendFormat(&out, "running=%d ", *value.time_running);
  }
  absl::StrAppend(&out, "values=[");
  bool first = true;
  for (const ReadEntry &entry : value.entries) {
    absl::StrAppendFormat(&out, "%s%d", first ? "" : ",", entry.value);
    if (entry.id) {
      absl::StrAppendFormat(&out, "(id=%d)", *entry.id);
    }
    if (entry.lost) {
      absl::StrAppendFormat(&out, "(lost=%d)", *entry.lost);
    }
    first = false;
  }
  absl::StrAppend(&out, "]}");
  return out;
}

std::string to_string(const SampleId &sample_id) {
  std::string out;
  append_opt(out, "pid", sample_id.pid);
  append_opt(out, "tid", sample_id.tid);
  append_opt(out, "time", sample_id.time);
  append_opt(out, "id", sample_id.id);
  append_opt(out, "stream_id", sample_id.stream_id);
  append_opt(out, "cpu", sample_id.cpu);
  return out;
}

std::string to_string(const Sample &sample) {
  std::string out;
  append_opt_hex(out, "ip", sample.ip);
  append_opt(out, "pid", sample.pid);
  append_opt(out, "tid", sample.tid);
  append_opt(out, "time", sample.time);
  append_opt_hex(out, "addr", sample.addr);
  append_opt(out, "id", sample.id);
  append_opt(out, "stream_id", sample.stream_id);
  append_opt(out, "cpu", sample.cpu);
  append_opt(out, "period", sample.period);
  if (sample.value) {
    absl::StrAppend(&out, " value=", to_string(*sample.value));
  }
  if (sample.callchain) {
    absl::StrAppendFormat(
        &out, " callchain=[%s]",
        absl::StrJoin(*sample.callchain, ",", [](std::string *o, uint64_t ip) {
          absl::StrAppendFormat(o, "%#x", ip);
        }));
  }
  if (sample.raw) {
    absl::StrAppendFormat(&out, " raw_size=%d", sample.raw->size());
  }
  append_opt(out, "lbr_hw_index", sample.lbr_hw_index);
  if (sample.lbr) {
    absl::StrAppend(&out, " lbr=[");
    for (const BranchEntry &entry : *sample.lbr) {
      absl::StrAppendFormat(&out, "{%#x->%#x%s}", entry.from(), entry.to(),
                            entry.mispred() ? " mispred" : "");
    }
    absl::StrAppend(&out, "]");
  }
  if (sample.regs_user) {
    append_registers(out, "regs_user", *sample.regs_user);
  }
  if (sample.stack_user) {
    absl::StrAppendFormat(&out, " stack_user_size=%d",
                          sample.stack_user->size());
  }
  append_opt(out, "weight", sample.weight);
  if (sample.data_src) {
    absl::StrAppendFormat(&out, " data_src=%#x", sample.data_src->bits());
  }
  if (sample.transaction) {
    absl::StrAppendFormat(&out, " transaction=%#x",
                          sample.transaction->bits());
  }
  if (sample.regs_intr) {
    append_registers(out, "regs_intr", *sample.regs_intr);
  }
  append_opt_hex(out, "phys_addr", sample.phys_addr);
  append_opt(out, "cgroup", sample.cgroup);
  append_opt(out, "data_page_size", sample.data_page_size);
  append_opt(out, "code_page_size", sample.code_page_size);
  if (sample.aux) {
    absl::StrAppendFormat(&out, " aux_size=%d", sample.aux->size());
  }
  if (!sample.extra.empty()) {
    absl::StrAppendFormat(&out, " extra_size=%d", sample.extra.size());
  }
  return out;
}

std::string to_string(const Record &record) {
  std::string out = absl::StrFormat("%s misc=%#x cpumode=%s",
                                    record_type_str(record.type), record.misc,
                                    cpumode_str(record.cpumode()));
  if (std::holds_alternative<UnknownRecord>(record.event)) {
    absl::StrAppendFormat(&out, " type=%d", record.type);
  }
  std::visit([&out](const auto &event) { append_event(out, event); },
             record.event);
  if (record.type != PERF_RECORD_SAMPLE) {
    std::string const sample_id = to_string(record.sample_id);
    if (!sample_id.empty()) {
      absl::StrAppend(&out, " sample_id={", sample_id.substr(1), "}");
    }
  }
  return out;
}

} // namespace perfev
