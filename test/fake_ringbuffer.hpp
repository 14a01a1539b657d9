// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "perf.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <linux/perf_event.h>
#include <stdexcept>
#include <sys/mman.h>
#include <vector>

namespace perfev {

/// Anonymous mapping laid out like a perf ring buffer (metadata page followed
/// by 2^data_pages_shift data pages). Plays the kernel side in tests.
class FakeRingBuffer {
public:
  explicit FakeRingBuffer(int data_pages_shift = 0)
      : _page_size(get_page_size()),
        _data_size(static_cast<size_t>(_page_size) << data_pages_shift),
        _size(_page_size + _data_size) {
    _region = mmap(nullptr, _size, PROT_READ | PROT_WRITE,
                   MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (_region == MAP_FAILED) {
      throw std::runtime_error("unable to map fake ring buffer");
    }
    meta()->data_offset = _page_size;
    meta()->data_size = _data_size;
  }
  ~FakeRingBuffer() { munmap(_region, _size); }

  FakeRingBuffer(const FakeRingBuffer &) = delete;
  FakeRingBuffer &operator=(const FakeRingBuffer &) = delete;

  [[nodiscard]] void *region() const { return _region; }
  [[nodiscard]] size_t size() const { return _size; }
  [[nodiscard]] size_t data_size() const { return _data_size; }
  [[nodiscard]] perf_event_mmap_page *meta() const {
    return static_cast<perf_event_mmap_page *>(_region);
  }

  [[nodiscard]] uint64_t head() const {
    return __atomic_load_n(&meta()->data_head, __ATOMIC_ACQUIRE);
  }
  [[nodiscard]] uint64_t tail() const {
    return __atomic_load_n(&meta()->data_tail, __ATOMIC_ACQUIRE);
  }

  /// Start both positions at `pos` (to place records across the wrap point)
  void reset_positions(uint64_t pos) {
    meta()->data_head = pos;
    meta()->data_tail = pos;
  }

  /// Copy bytes at the write position and publish them
  void write(const std::vector<std::byte> &bytes) {
    uint64_t const head = meta()->data_head;
    auto *data = static_cast<std::byte *>(_region) + _page_size;
    for (size_t i = 0; i < bytes.size(); ++i) {
      data[(head + i) & (_data_size - 1)] = bytes[i];
    }
    __atomic_store_n(&meta()->data_head, head + bytes.size(),
                     __ATOMIC_RELEASE);
  }

private:
  size_t _page_size;
  size_t _data_size;
  size_t _size;
  void *_region{nullptr};
};

} // namespace perfev
