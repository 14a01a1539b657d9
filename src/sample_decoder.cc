// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sample_decoder.hpp"

#include "field_decoder.hpp"
#include "peres_helpers.hpp"

#include <algorithm>
#include <bit>

namespace perfev {

namespace {

template <typename T>
PERes read_optional(ByteCursor &cursor, std::optional<T> *out) {
  T value;
  PERES_CHECK_FWD_STRICT(read_native(cursor, &value));
  *out = value;
  return {};
}

PERes decode_read_entry(const ParseConfig &config, ByteCursor &cursor,
                        ReadEntry *entry) {
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &entry->value));
  if (config.has_read_format(PERF_FORMAT_ID)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &entry->id));
  }
  if (config.has_read_format(PERF_FORMAT_LOST)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &entry->lost));
  }
  return {};
}

PERes decode_stack_user(ByteCursor &cursor,
                        std::optional<std::vector<std::byte>> *out) {
  std::vector<std::byte> stack;
  PERES_CHECK_FWD_STRICT(read_length_prefixed(cursor, &stack));
  if (!stack.empty()) {
    // The kernel reserves the requested size but may copy less
    uint64_t dyn_size;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &dyn_size));
    stack.resize(std::min<uint64_t>(dyn_size, stack.size()));
  }
  *out = std::move(stack);
  return {};
}

} // namespace

PERes decode_read_value(const ParseConfig &config, ByteCursor &cursor,
                        ReadValue *out) {
  *out = {};
  if (config.has_read_format(PERF_FORMAT_GROUP)) {
    out->group = true;
    uint64_t nr;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &nr));
    if (config.has_read_format(PERF_FORMAT_TOTAL_TIME_ENABLED)) {
      PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->time_enabled));
    }
    if (config.has_read_format(PERF_FORMAT_TOTAL_TIME_RUNNING)) {
      PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->time_running));
    }
    // each entry takes at least one u64
    if (unlikely(nr > cursor.remaining_len() / sizeof(uint64_t))) {
      return peres_warn(PE_WHAT_EOD);
    }
    out->entries.resize(nr);
    for (ReadEntry &entry : out->entries) {
      PERES_CHECK_FWD_STRICT(decode_read_entry(config, cursor, &entry));
    }
    return {};
  }

  ReadEntry entry;
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &entry.value));
  if (config.has_read_format(PERF_FORMAT_TOTAL_TIME_ENABLED)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->time_enabled));
  }
  if (config.has_read_format(PERF_FORMAT_TOTAL_TIME_RUNNING)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->time_running));
  }
  if (config.has_read_format(PERF_FORMAT_ID)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &entry.id));
  }
  if (config.has_read_format(PERF_FORMAT_LOST)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &entry.lost));
  }
  out->entries.push_back(entry);
  return {};
}

PERes decode_registers(uint64_t mask, ByteCursor &cursor, Registers *out) {
  *out = {};
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &out->abi));
  // The kernel writes no register when it could not sample them, whatever
  // the requested mask
  if (out->abi == PERF_SAMPLE_REGS_ABI_NONE) {
    return {};
  }
  out->mask = mask;
  return read_u64_values(cursor, std::popcount(mask), &out->regs);
}

PERes decode_branch_stack(const ParseConfig &config, ByteCursor &cursor,
                          std::optional<uint64_t> *hw_index,
                          std::vector<BranchEntry> *out) {
  uint64_t nr;
  PERES_CHECK_FWD_STRICT(read_u64(cursor, &nr));
  if (config.branch_sample_type & PERF_SAMPLE_BRANCH_HW_INDEX) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, hw_index));
  }
  if (unlikely(nr > cursor.remaining_len() / k_branch_entry_size)) {
    return peres_warn(PE_WHAT_EOD);
  }
  out->clear();
  out->reserve(nr);
  for (uint64_t i = 0; i < nr; ++i) {
    uint64_t from;
    uint64_t to;
    uint64_t flags;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &from));
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &to));
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &flags));
    out->emplace_back(from, to, flags);
  }
  return {};
}

PERes decode_sample(const ParseConfig &config, uint16_t /*misc*/,
                    ByteCursor &cursor, Sample *out) {
  *out = {};
  std::optional<uint64_t> identifier;
  if (config.has_sample(PERF_SAMPLE_IDENTIFIER)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &identifier));
  }
  if (config.has_sample(PERF_SAMPLE_IP)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->ip));
  }
  if (config.has_sample(PERF_SAMPLE_TID)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->pid));
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->tid));
  }
  if (config.has_sample(PERF_SAMPLE_TIME)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->time));
  }
  if (config.has_sample(PERF_SAMPLE_ADDR)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->addr));
  }
  if (config.has_sample(PERF_SAMPLE_ID)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->id));
  }
  if (config.has_sample(PERF_SAMPLE_STREAM_ID)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->stream_id));
  }
  if (config.has_sample(PERF_SAMPLE_CPU)) {
    uint32_t res;
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->cpu));
    PERES_CHECK_FWD_STRICT(read_u32(cursor, &res));
  }
  if (config.has_sample(PERF_SAMPLE_PERIOD)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->period));
  }
  if (config.has_sample(PERF_SAMPLE_READ)) {
    ReadValue value;
    PERES_CHECK_FWD_STRICT(decode_read_value(config, cursor, &value));
    out->value = std::move(value);
  }
  if (config.has_sample(PERF_SAMPLE_CALLCHAIN)) {
    std::vector<uint64_t> ips;
    PERES_CHECK_FWD_STRICT(read_u64_array(cursor, &ips));
    out->callchain = std::move(ips);
  }
  if (config.has_sample(PERF_SAMPLE_RAW)) {
    std::vector<std::byte> raw;
    // kernel layout is { u32 size; char data[size]; }, padded to 8 bytes
    PERES_CHECK_FWD_STRICT(read_length_prefixed_u32(cursor, &raw));
    out->raw = std::move(raw);
  }
  if (config.has_sample(PERF_SAMPLE_BRANCH_STACK)) {
    std::vector<BranchEntry> lbr;
    PERES_CHECK_FWD_STRICT(
        decode_branch_stack(config, cursor, &out->lbr_hw_index, &lbr));
    out->lbr = std::move(lbr);
  }
  if (config.has_sample(PERF_SAMPLE_REGS_USER)) {
    Registers regs;
    PERES_CHECK_FWD_STRICT(decode_registers(config.regs_user, cursor, &regs));
    out->regs_user = std::move(regs);
  }
  if (config.has_sample(PERF_SAMPLE_STACK_USER)) {
    PERES_CHECK_FWD_STRICT(decode_stack_user(cursor, &out->stack_user));
  }
  if (config.has_sample(PERF_SAMPLE_WEIGHT) ||
      config.has_sample(PERF_SAMPLE_WEIGHT_STRUCT)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->weight));
  }
  if (config.has_sample(PERF_SAMPLE_DATA_SRC)) {
    uint64_t data_src;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &data_src));
    out->data_src = DataSource(data_src);
  }
  if (config.has_sample(PERF_SAMPLE_TRANSACTION)) {
    uint64_t transaction;
    PERES_CHECK_FWD_STRICT(read_u64(cursor, &transaction));
    out->transaction = Txn(transaction);
  }
  if (config.has_sample(PERF_SAMPLE_REGS_INTR)) {
    Registers regs;
    PERES_CHECK_FWD_STRICT(decode_registers(config.regs_intr, cursor, &regs));
    out->regs_intr = std::move(regs);
  }
  if (config.has_sample(PERF_SAMPLE_PHYS_ADDR)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->phys_addr));
  }
  if (config.has_sample(PERF_SAMPLE_CGROUP)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->cgroup));
  }
  if (config.has_sample(PERF_SAMPLE_DATA_PAGE_SIZE)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->data_page_size));
  }
  if (config.has_sample(PERF_SAMPLE_CODE_PAGE_SIZE)) {
    PERES_CHECK_FWD_STRICT(read_optional(cursor, &out->code_page_size));
  }
  if (config.has_sample(PERF_SAMPLE_AUX)) {
    std::vector<std::byte> aux;
    PERES_CHECK_FWD_STRICT(read_length_prefixed(cursor, &aux));
    out->aux = std::move(aux);
  }
  // fields from newer kernels
  PERES_CHECK_FWD_STRICT(read_remainder(cursor, &out->extra));

  if (!out->id) {
    out->id = identifier;
  }
  return {};
}

} // namespace perfev
