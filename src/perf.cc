// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "perf.hpp"

#include "logger.hpp"
#include "peres_helpers.hpp"

#include <sys/mman.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace perfev {

namespace {
long s_page_size = 0;
constexpr long k_default_page_size{4096};
} // namespace

long get_page_size() {
  if (!s_page_size) {
    s_page_size = sysconf(_SC_PAGESIZE);
    if (s_page_size <= 0) {
      s_page_size = k_default_page_size;
    } else if (s_page_size != k_default_page_size) {
      LG_NTC("Page size is %ld", s_page_size);
    }
  }
  return s_page_size;
}

int perf_event_open(struct perf_event_attr *attr, pid_t pid, int cpu, int gfd,
                    unsigned long flags) {
  return static_cast<int>(
      syscall(__NR_perf_event_open, attr, pid, cpu, gfd, flags));
}

PERes perf_event_open_fd(struct perf_event_attr *attr, pid_t pid, int cpu,
                         UniqueFd *fd) {
  int const raw_fd = perf_event_open(attr, pid, cpu, -1, PERF_FLAG_FD_CLOEXEC);
  PERES_CHECK_ERRNO(raw_fd, PE_WHAT_PERFOPEN,
                    "perf_event_open failed (type=%u config=%llu pid=%d)",
                    attr->type, attr->config, pid);
  fd->reset(raw_fd);
  return {};
}

size_t perf_mmap_size(int buf_size_shift) {
  // size of buffers are constrained to a power of 2 + 1
  return ((1UL << buf_size_shift) + 1) * get_page_size();
}

PERes PerfMapping::map(int fd, size_t size, PerfMapping *mapping) {
  void *region =
      mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if (region == MAP_FAILED) {
    PERES_RETURN_ERROR_LOG(PE_WHAT_PERFMMAP,
                           "Could not mmap %zu bytes of perf fd %d", size, fd);
  }
  PerfMapping new_mapping;
  new_mapping._region = region;
  new_mapping._sz = size;
  *mapping = std::move(new_mapping);
  return {};
}

PerfMapping::~PerfMapping() {
  if (_region && munmap(_region, _sz) == -1) {
    LG_ERR("Bad parameters when munmap %p - %zu", _region, _sz);
  }
}

} // namespace perfev
