// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "perf_regs.hpp"

#include <cstddef>
#include <cstdint>
#include <linux/perf_event.h>
#include <optional>
#include <vector>

namespace perfev {

/// One counter value in a read_format payload
struct ReadEntry {
  uint64_t value{0};
  std::optional<uint64_t> id;   // PERF_FORMAT_ID
  std::optional<uint64_t> lost; // PERF_FORMAT_LOST

  friend bool operator==(const ReadEntry &, const ReadEntry &) = default;
};

/// Counter values, either for a single counter or for a whole group
/// (PERF_FORMAT_GROUP). A single counter read has exactly one entry.
struct ReadValue {
  bool group{false};
  std::optional<uint64_t> time_enabled; // PERF_FORMAT_TOTAL_TIME_ENABLED
  std::optional<uint64_t> time_running; // PERF_FORMAT_TOTAL_TIME_RUNNING
  std::vector<ReadEntry> entries;

  /// Value of the first (or only) counter
  [[nodiscard]] uint64_t value() const {
    return entries.empty() ? 0 : entries.front().value;
  }

  /// Value extrapolated to the full enabled time, to compensate for counter
  /// multiplexing. Needs both times to be part of the read format.
  [[nodiscard]] std::optional<uint64_t> scaled_value(size_t idx = 0) const;

  friend bool operator==(const ReadValue &, const ReadValue &) = default;
};

/// Register snapshot (PERF_SAMPLE_REGS_USER / PERF_SAMPLE_REGS_INTR)
struct Registers {
  uint64_t abi{PERF_SAMPLE_REGS_ABI_NONE};
  // registers that were actually sampled (0 when abi is NONE)
  uint64_t mask{0};
  // one value per bit of mask, in ascending bit order
  std::vector<uint64_t> regs;

  /// Value of the register with kernel index `reg_idx`, if it was sampled
  [[nodiscard]] std::optional<uint64_t> get(uint8_t reg_idx) const;
  [[nodiscard]] std::optional<uint64_t> get(X86Reg reg) const {
    return get(static_cast<uint8_t>(reg));
  }
  [[nodiscard]] std::optional<uint64_t> get(Arm64Reg reg) const {
    return get(static_cast<uint8_t>(reg));
  }

  friend bool operator==(const Registers &, const Registers &) = default;
};

/// Memory access description (PERF_SAMPLE_DATA_SRC)
class DataSource {
public:
  DataSource() = default;
  explicit DataSource(uint64_t bits) : _bits(bits) {}

  [[nodiscard]] uint64_t bits() const { return _bits; }

  [[nodiscard]] uint64_t mem_op() const { return field(PERF_MEM_OP_SHIFT, 5); }
  [[nodiscard]] uint64_t mem_lvl() const {
    return field(PERF_MEM_LVL_SHIFT, 14);
  }
  [[nodiscard]] uint64_t mem_snoop() const {
    return field(PERF_MEM_SNOOP_SHIFT, 5);
  }
  [[nodiscard]] uint64_t mem_lock() const {
    return field(PERF_MEM_LOCK_SHIFT, 2);
  }
  [[nodiscard]] uint64_t mem_dtlb() const {
    return field(PERF_MEM_TLB_SHIFT, 7);
  }
  [[nodiscard]] uint64_t mem_lvl_num() const {
    return field(PERF_MEM_LVLNUM_SHIFT, 4);
  }
  [[nodiscard]] bool mem_remote() const {
    return field(PERF_MEM_REMOTE_SHIFT, 1) != 0;
  }
  [[nodiscard]] uint64_t mem_snoopx() const {
    return field(PERF_MEM_SNOOPX_SHIFT, 2);
  }
  [[nodiscard]] uint64_t mem_blk() const {
    return field(PERF_MEM_BLK_SHIFT, 3);
  }
  [[nodiscard]] uint64_t mem_hops() const {
    return field(PERF_MEM_HOPS_SHIFT, 3);
  }

  friend bool operator==(DataSource, DataSource) = default;

private:
  [[nodiscard]] uint64_t field(unsigned shift, unsigned width) const {
    return (_bits >> shift) & ((1ULL << width) - 1);
  }

  uint64_t _bits{0};
};

/// Transaction flags (PERF_SAMPLE_TRANSACTION), PERF_TXN_* bits
class Txn {
public:
  Txn() = default;
  explicit Txn(uint64_t bits) : _bits(bits) {}

  [[nodiscard]] uint64_t bits() const { return _bits; }
  [[nodiscard]] bool has(uint64_t txn_flag) const {
    return (_bits & txn_flag) != 0;
  }
  /// User provided abort code
  [[nodiscard]] uint32_t abort_code() const {
    return static_cast<uint32_t>((_bits & PERF_TXN_ABORT_MASK) >>
                                 PERF_TXN_ABORT_SHIFT);
  }

  friend bool operator==(Txn, Txn) = default;

private:
  uint64_t _bits{0};
};

/// One entry of the last branch record stack (perf_branch_entry).
/// The flag word is decoded with shifts, its bitfield layout is fixed by the
/// kernel ABI.
class BranchEntry {
public:
  BranchEntry() = default;
  BranchEntry(uint64_t from, uint64_t to, uint64_t flags)
      : _from(from), _to(to), _flags(flags) {}

  [[nodiscard]] uint64_t from() const { return _from; }
  [[nodiscard]] uint64_t to() const { return _to; }
  [[nodiscard]] uint64_t flags() const { return _flags; }

  [[nodiscard]] bool mispred() const { return bit(0); }
  [[nodiscard]] bool predicted() const { return bit(1); }
  [[nodiscard]] bool in_tx() const { return bit(2); }
  [[nodiscard]] bool abort() const { return bit(3); }
  [[nodiscard]] uint16_t cycles() const {
    return static_cast<uint16_t>((_flags >> 4) & 0xffff);
  }
  /// PERF_BR_* branch type
  [[nodiscard]] uint8_t type() const {
    return static_cast<uint8_t>((_flags >> 20) & 0xf);
  }

  friend bool operator==(const BranchEntry &, const BranchEntry &) = default;

private:
  [[nodiscard]] bool bit(unsigned pos) const { return (_flags >> pos) & 1; }

  uint64_t _from{0};
  uint64_t _to{0};
  uint64_t _flags{0};
};

inline constexpr size_t k_branch_entry_size = 3 * sizeof(uint64_t);

/// Split view of a PERF_SAMPLE_WEIGHT_STRUCT weight
struct SampleWeight {
  uint32_t var1_dw;
  uint16_t var2_w;
  uint16_t var3_w;
};

/// PERF_RECORD_SAMPLE. A field is set only when its PERF_SAMPLE_* bit is part
/// of the configured sample type.
struct Sample {
  std::optional<uint64_t> ip;
  std::optional<uint32_t> pid;
  std::optional<uint32_t> tid;
  std::optional<uint64_t> time;
  std::optional<uint64_t> addr;
  // PERF_SAMPLE_ID, or PERF_SAMPLE_IDENTIFIER when ID is not requested
  std::optional<uint64_t> id;
  std::optional<uint64_t> stream_id;
  std::optional<uint32_t> cpu;
  std::optional<uint64_t> period;
  std::optional<ReadValue> value;
  std::optional<std::vector<uint64_t>> callchain;
  std::optional<std::vector<std::byte>> raw;
  std::optional<uint64_t> lbr_hw_index;
  std::optional<std::vector<BranchEntry>> lbr;
  std::optional<Registers> regs_user;
  // truncated to the dynamic size reported by the kernel
  std::optional<std::vector<std::byte>> stack_user;
  std::optional<uint64_t> weight; // WEIGHT or WEIGHT_STRUCT
  std::optional<DataSource> data_src;
  std::optional<Txn> transaction;
  std::optional<Registers> regs_intr;
  std::optional<uint64_t> phys_addr;
  std::optional<uint64_t> cgroup;
  std::optional<uint64_t> data_page_size;
  std::optional<uint64_t> code_page_size;
  std::optional<std::vector<std::byte>> aux;
  // Bytes following the last known field (newer kernels)
  std::vector<std::byte> extra;

  [[nodiscard]] std::optional<SampleWeight> weight_struct() const;

  friend bool operator==(const Sample &, const Sample &) = default;
};

} // namespace perfev
