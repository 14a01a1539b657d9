// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "peres_def.hpp"

#include <cstddef>
#include <cstdint>
#include <linux/perf_event.h>

namespace perfev {

/// Layout of a perf ring buffer mapping: one metadata page
/// (perf_event_mmap_page) followed by a power of two data area
struct RingBuffer {
  perf_event_mmap_page *meta;
  std::byte *data;
  uint64_t data_size;
  uint64_t mask;

  uint64_t *writer_pos; // data_head, written by the kernel
  uint64_t *reader_pos; // data_tail, written by the consumer
};

/// Fill `rb` from a mapping of `mapped_size` bytes starting at `base`.
/// Uses data_offset / data_size from the metadata page, falling back to the
/// legacy layout (data right after the first page) on kernels that leave them
/// at zero.
PERes rb_init(RingBuffer *rb, void *base, size_t mapped_size);

/// Consumer side of a perf ring buffer. Only one reader may exist per ring
/// buffer at any time.
class PerfRingBufferReader {
public:
  explicit PerfRingBufferReader(RingBuffer &rb)
      : _rb(rb), _tail(*rb.reader_pos), _head(_tail) {}

  PerfRingBufferReader(const PerfRingBufferReader &) = delete;
  PerfRingBufferReader &operator=(const PerfRingBufferReader &) = delete;

  /// Observe the kernel write position and return the unread byte count
  size_t update_available() {
    // pairs with the release store of data_head in the kernel
    _head = __atomic_load_n(_rb.writer_pos, __ATOMIC_ACQUIRE);
    return available_size();
  }

  [[nodiscard]] size_t available_size() const { return _head - _tail; }

  /// Unread bytes as one or two spans. `cursor` is left empty when there is
  /// nothing to read. Fails if the kernel position is inconsistent with ours.
  PERes next_span(ByteCursor *cursor);

  /// Give `n` bytes back to the kernel. Must be called once per record, with
  /// the size declared in its header, after its bytes were read.
  void release(size_t n) {
    _tail += n;
    // the reads of the record must not move after the store
    __atomic_signal_fence(__ATOMIC_SEQ_CST);
    __atomic_store_n(_rb.reader_pos, _tail, __ATOMIC_RELEASE);
  }

  [[nodiscard]] uint64_t tail() const { return _tail; }
  [[nodiscard]] uint64_t head() const { return _head; }

private:
  RingBuffer &_rb;
  uint64_t _tail;
  uint64_t _head;
};

} // namespace perfev
