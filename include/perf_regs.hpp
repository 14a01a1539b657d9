// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>

namespace perfev {

// Kernel register numbering used in sample_regs_user / sample_regs_intr.
// Values come from arch/<arch>/include/uapi/asm/perf_regs.h, they are
// repeated here so that records from either architecture can be decoded on
// any host.

enum class X86Reg : uint8_t {
  kAx = 0,
  kBx,
  kCx,
  kDx,
  kSi,
  kDi,
  kBp,
  kSp,
  kIp,
  kFlags,
  kCs,
  kSs,
  kDs,
  kEs,
  kFs,
  kGs,
  kR8,
  kR9,
  kR10,
  kR11,
  kR12,
  kR13,
  kR14,
  kR15,
};

enum class Arm64Reg : uint8_t {
  kX0 = 0,
  kX29 = 29,
  kLr = 30,
  kSp = 31,
  kPc = 32,
};

// Registers readable with common user permissions (segment registers
// ds/es/fs/gs are left out on x86-64)
inline constexpr uint64_t k_x86_64_user_regs_mask = 0xff0fff;
inline constexpr uint64_t k_arm64_user_regs_mask = (1ULL << 33) - 1;

#if defined(__x86_64__)
inline constexpr uint64_t k_perf_register_mask = k_x86_64_user_regs_mask;
#elif defined(__aarch64__)
inline constexpr uint64_t k_perf_register_mask = k_arm64_user_regs_mask;
#else
inline constexpr uint64_t k_perf_register_mask = 0;
#endif

} // namespace perfev
