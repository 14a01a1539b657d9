// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sample.hpp"

#include <bit>
#include <cstring>

namespace perfev {

std::optional<uint64_t> ReadValue::scaled_value(size_t idx) const {
  if (idx >= entries.size() || !time_enabled || !time_running) {
    return std::nullopt;
  }
  uint64_t const value = entries[idx].value;
  if (*time_running == 0) {
    return 0;
  }
  if (*time_running == *time_enabled) {
    return value;
  }
  // value * enabled / running without overflowing 64 bits
  uint64_t const quot = value / *time_running;
  uint64_t const rem = value % *time_running;
  return quot * *time_enabled +
      static_cast<uint64_t>(static_cast<unsigned __int128>(rem) *
                            *time_enabled / *time_running);
}

std::optional<uint64_t> Registers::get(uint8_t reg_idx) const {
  if (reg_idx >= 64 || !(mask & (1ULL << reg_idx))) {
    return std::nullopt;
  }
  // registers are stored in ascending bit order
  auto const pos =
      static_cast<size_t>(std::popcount(mask & ((1ULL << reg_idx) - 1)));
  if (pos >= regs.size()) {
    return std::nullopt;
  }
  return regs[pos];
}

std::optional<SampleWeight> Sample::weight_struct() const {
  if (!weight) {
    return std::nullopt;
  }
  SampleWeight split;
  uint64_t const full = *weight;
  split.var1_dw = static_cast<uint32_t>(full);
  split.var2_w = static_cast<uint16_t>(full >> 32);
  split.var3_w = static_cast<uint16_t>(full >> 48);
  return split;
}

} // namespace perfev
