// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "sample.hpp"
#include "sample_id.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <linux/perf_event.h>
#include <string>
#include <variant>
#include <vector>

namespace perfev {

/// PERF_RECORD_MMAP
struct MmapRecord {
  uint32_t pid;
  uint32_t tid;
  uint64_t addr;
  uint64_t len;
  uint64_t pgoff;
  std::string filename;
};

/// PERF_RECORD_LOST
struct LostRecord {
  uint64_t id;
  uint64_t lost;
};

/// PERF_RECORD_COMM
struct CommRecord {
  uint32_t pid;
  uint32_t tid;
  std::string comm;
};

struct TaskRecord {
  uint32_t pid;
  uint32_t ppid;
  uint32_t tid;
  uint32_t ptid;
  uint64_t time;
};

/// PERF_RECORD_EXIT
struct ExitRecord : TaskRecord {};
/// PERF_RECORD_FORK
struct ForkRecord : TaskRecord {};

struct ThrottleEvent {
  uint64_t time;
  uint64_t id;
  uint64_t stream_id;
};

/// PERF_RECORD_THROTTLE
struct ThrottleRecord : ThrottleEvent {};
/// PERF_RECORD_UNTHROTTLE
struct UnthrottleRecord : ThrottleEvent {};

/// PERF_RECORD_READ
struct ReadRecord {
  uint32_t pid;
  uint32_t tid;
  ReadValue values;
};

inline constexpr size_t k_build_id_max_size = 20;

/// PERF_RECORD_MMAP2. Holds either the device / inode identification or the
/// build id of the mapped file (PERF_RECORD_MISC_MMAP_BUILD_ID).
struct Mmap2Record {
  uint32_t pid;
  uint32_t tid;
  uint64_t addr;
  uint64_t len;
  uint64_t pgoff;
  bool has_build_id;
  // device / inode identification
  uint32_t maj;
  uint32_t min;
  uint64_t ino;
  uint64_t ino_generation;
  // build id identification
  uint8_t build_id_size;
  std::array<std::byte, k_build_id_max_size> build_id;
  uint32_t prot;
  uint32_t flags;
  std::string filename;
};

/// PERF_RECORD_AUX
struct AuxRecord {
  uint64_t aux_offset;
  uint64_t aux_size;
  uint64_t flags; // PERF_AUX_FLAG_*
};

/// PERF_RECORD_ITRACE_START
struct ITraceStartRecord {
  uint32_t pid;
  uint32_t tid;
};

/// PERF_RECORD_LOST_SAMPLES
struct LostSamplesRecord {
  uint64_t lost;
};

/// PERF_RECORD_SWITCH (direction in the misc flags)
struct SwitchRecord {
  bool switch_out;
};

/// PERF_RECORD_SWITCH_CPU_WIDE
struct SwitchCpuWideRecord {
  bool switch_out;
  // next task when switching out, previous task when switching in
  uint32_t next_prev_pid;
  uint32_t next_prev_tid;
};

struct NamespaceEntry {
  uint64_t dev;
  uint64_t inode;
  friend bool operator==(const NamespaceEntry &,
                         const NamespaceEntry &) = default;
};

/// PERF_RECORD_NAMESPACES
struct NamespacesRecord {
  uint32_t pid;
  uint32_t tid;
  std::vector<NamespaceEntry> namespaces;
};

/// PERF_RECORD_KSYMBOL
struct KSymbolRecord {
  uint64_t addr;
  uint32_t len;
  uint16_t ksym_type; // PERF_RECORD_KSYMBOL_TYPE_*
  uint16_t flags;     // PERF_RECORD_KSYMBOL_FLAGS_*
  std::string name;
};

inline constexpr size_t k_bpf_tag_size = 8;

/// PERF_RECORD_BPF_EVENT
struct BpfEventRecord {
  uint16_t type; // PERF_BPF_EVENT_*
  uint16_t flags;
  uint32_t id;
  std::array<std::byte, k_bpf_tag_size> tag;
};

/// PERF_RECORD_CGROUP
struct CgroupRecord {
  uint64_t id;
  std::string path;
};

/// PERF_RECORD_TEXT_POKE
struct TextPokeRecord {
  uint64_t addr;
  std::vector<std::byte> old_bytes;
  std::vector<std::byte> new_bytes;
};

/// PERF_RECORD_AUX_OUTPUT_HW_ID
struct AuxOutputHwIdRecord {
  uint64_t hw_id;
};

/// Record type this library can not decode, kept as raw bytes
struct UnknownRecord {
  std::vector<std::byte> data;
};

using RecordEvent =
    std::variant<UnknownRecord, MmapRecord, LostRecord, CommRecord,
                 ExitRecord, ThrottleRecord, UnthrottleRecord, ForkRecord,
                 ReadRecord, Sample, Mmap2Record, AuxRecord, ITraceStartRecord,
                 LostSamplesRecord, SwitchRecord, SwitchCpuWideRecord,
                 NamespacesRecord, KSymbolRecord, BpfEventRecord, CgroupRecord,
                 TextPokeRecord, AuxOutputHwIdRecord>;

enum class CpuMode : uint16_t {
  kUnknown = PERF_RECORD_MISC_CPUMODE_UNKNOWN,
  kKernel = PERF_RECORD_MISC_KERNEL,
  kUser = PERF_RECORD_MISC_USER,
  kHypervisor = PERF_RECORD_MISC_HYPERVISOR,
  kGuestKernel = PERF_RECORD_MISC_GUEST_KERNEL,
  kGuestUser = PERF_RECORD_MISC_GUEST_USER,
};

inline CpuMode cpumode_from_misc(uint16_t misc) {
  return static_cast<CpuMode>(misc & PERF_RECORD_MISC_CPUMODE_MASK);
}

const char *cpumode_str(CpuMode mode);

/// A decoded record
struct Record {
  uint32_t type{0};
  uint16_t misc{0};
  RecordEvent event;
  SampleId sample_id;

  [[nodiscard]] CpuMode cpumode() const { return cpumode_from_misc(misc); }
  /// PERF_RECORD_MISC_* flag test (the meaning of a bit depends on the type)
  [[nodiscard]] bool has_misc(uint16_t flag) const {
    return (misc & flag) != 0;
  }
  /// PERF_RECORD_MISC_EXACT_IP, only meaningful for samples
  [[nodiscard]] bool exact_ip() const {
    return type == PERF_RECORD_SAMPLE && has_misc(PERF_RECORD_MISC_EXACT_IP);
  }

  template <typename T> [[nodiscard]] const T *get_if() const {
    return std::get_if<T>(&event);
  }
};

} // namespace perfev
