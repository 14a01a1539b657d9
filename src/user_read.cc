// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "user_read.hpp"

#include "peres_helpers.hpp"

#if defined(__x86_64__) || defined(__i386__)
#  include <x86intrin.h>
#endif

namespace perfev {

namespace {

// Equivalent of the kernel READ_ONCE
template <typename T> T read_once(const T *ptr) {
  return __atomic_load_n(ptr, __ATOMIC_RELAXED);
}

// Equivalent of the kernel barrier()
inline void barrier() { __atomic_signal_fence(__ATOMIC_SEQ_CST); }

#if defined(__x86_64__) || defined(__i386__)
uint64_t x86_read_pmc(uint32_t idx) { return __rdpmc(static_cast<int>(idx)); }
uint64_t x86_read_tsc() { return __rdtsc(); }
#endif

// One attempt of the seqlock read. Returns false if the page changed.
bool try_read_user(const perf_event_mmap_page *page,
                   const UserReadHooks &hooks, UserReadData *out) {
  uint32_t const seq = __atomic_load_n(&page->lock, __ATOMIC_ACQUIRE);
  barrier();

  uint64_t const capabilities = read_once(&page->capabilities);
  perf_event_mmap_page caps{};
  caps.capabilities = capabilities;

  uint64_t enabled = read_once(&page->time_enabled);
  uint64_t running = read_once(&page->time_running);
  uint32_t const index = read_once(&page->index);
  int64_t count = read_once(&page->offset);
  bool has_pmc_value = false;

  bool const counter_active = caps.cap_user_rdpmc && index != 0;

  if (counter_active && hooks.read_pmc) {
    uint16_t const width = read_once(&page->pmc_width);
    auto pmc = static_cast<int64_t>(hooks.read_pmc(index - 1));
    if (width > 0 && width < 64) {
      // sign extend the raw counter value
      pmc = static_cast<int64_t>(static_cast<uint64_t>(pmc) << (64 - width)) >>
          (64 - width);
    }
    count = static_cast<int64_t>(static_cast<uint64_t>(count) +
                                 static_cast<uint64_t>(pmc));
    has_pmc_value = true;
  }

  // enabled / running are only stale while the counter is active
  if (caps.cap_user_time && counter_active && hooks.read_tsc) {
    uint64_t cyc = hooks.read_tsc();
    uint64_t const time_offset = read_once(&page->time_offset);
    uint64_t const time_mult = read_once(&page->time_mult);
    uint16_t const time_shift = read_once(&page->time_shift);

    if (caps.cap_user_time_short) {
      uint64_t const time_cycles = read_once(&page->time_cycles);
      uint64_t const time_mask = read_once(&page->time_mask);
      cyc = time_cycles + ((cyc - time_cycles) & time_mask);
    }

    uint64_t const quot = cyc >> time_shift;
    uint64_t const rem = cyc & ((1ULL << time_shift) - 1);
    uint64_t const delta =
        time_offset + quot * time_mult + ((rem * time_mult) >> time_shift);

    enabled += delta;
    running += delta;
  }

  barrier();
  if (__atomic_load_n(&page->lock, __ATOMIC_ACQUIRE) != seq) {
    return false;
  }

  out->time_enabled = enabled;
  out->time_running = running;
  out->count = has_pmc_value
      ? std::optional<uint64_t>(static_cast<uint64_t>(count))
      : std::nullopt;
  return true;
}

} // namespace

std::optional<uint64_t> UserReadData::scaled_count() const {
  if (!count) {
    return std::nullopt;
  }
  if (time_running == 0) {
    return 0;
  }
  uint64_t const quot = *count / time_running;
  uint64_t const rem = *count % time_running;
  return quot * time_enabled +
      static_cast<uint64_t>(static_cast<unsigned __int128>(rem) *
                            time_enabled / time_running);
}

UserReadHooks host_user_read_hooks() {
#if defined(__x86_64__) || defined(__i386__)
  return {.read_pmc = x86_read_pmc, .read_tsc = x86_read_tsc};
#else
  return {.read_pmc = nullptr, .read_tsc = nullptr};
#endif
}

PERes read_user(const perf_event_mmap_page *page, UserReadData *out) {
  return read_user(page, host_user_read_hooks(), out);
}

PERes read_user(const perf_event_mmap_page *page, const UserReadHooks &hooks,
                UserReadData *out) {
  PERES_CHECK_BOOL(page, PE_WHAT_ARGUMENT, "No metadata page to read from");
  for (int attempt = 0; attempt < k_user_read_max_attempts; ++attempt) {
    if (try_read_user(page, hooks, out)) {
      return {};
    }
  }
  PERES_RETURN_WARN_LOG(PE_WHAT_USERREAD,
                        "Metadata page kept changing during %d reads",
                        k_user_read_max_attempts);
}

} // namespace perfev
