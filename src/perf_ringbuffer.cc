// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "perf_ringbuffer.hpp"

#include "peres_helpers.hpp"
#include "perf.hpp"

#include <bit>

namespace perfev {

PERes rb_init(RingBuffer *rb, void *base, size_t mapped_size) {
  PERES_CHECK_BOOL(base, PE_WHAT_PERFRB, "Null ring buffer mapping");
  size_t const page_size = get_page_size();
  PERES_CHECK_BOOL(mapped_size > page_size, PE_WHAT_PERFRB,
                   "Ring buffer mapping too small (%zu bytes)", mapped_size);

  auto *meta = static_cast<perf_event_mmap_page *>(base);
  uint64_t data_offset = meta->data_offset;
  uint64_t data_size = meta->data_size;
  if (data_size == 0) {
    // kernels before 4.1 do not fill the fields
    data_offset = page_size;
    data_size = mapped_size - page_size;
  }
  PERES_CHECK_BOOL(std::has_single_bit(data_size), PE_WHAT_PERFRB,
                   "Ring buffer size %lu is not a power of two", data_size);
  PERES_CHECK_BOOL(data_offset <= mapped_size &&
                       data_size <= mapped_size - data_offset,
                   PE_WHAT_PERFRB,
                   "Ring buffer data area (offset=%lu size=%lu) outside of "
                   "the mapping (%zu bytes)",
                   data_offset, data_size, mapped_size);

  rb->meta = meta;
  rb->data = static_cast<std::byte *>(base) + data_offset;
  rb->data_size = data_size;
  rb->mask = data_size - 1;
  rb->writer_pos = reinterpret_cast<uint64_t *>(&meta->data_head);
  rb->reader_pos = reinterpret_cast<uint64_t *>(&meta->data_tail);
  return {};
}

PERes PerfRingBufferReader::next_span(ByteCursor *cursor) {
  *cursor = {};
  size_t const available = update_available();
  if (available == 0) {
    return {};
  }
  if (unlikely(available > _rb.data_size)) {
    PERES_RETURN_ERROR_LOG(PE_WHAT_PERFRB,
                           "Ring buffer head=%lu is %zu bytes ahead of "
                           "tail=%lu (size=%lu)",
                           _head, available, _tail, _rb.data_size);
  }
  uint64_t const start = _tail & _rb.mask;
  if (start + available <= _rb.data_size) {
    *cursor = ByteCursor(ConstBuffer{_rb.data + start, available});
    return {};
  }
  size_t const first_len = _rb.data_size - start;
  *cursor = ByteCursor(ConstBuffer{_rb.data + start, first_len},
                       ConstBuffer{_rb.data, available - first_len});
  return {};
}

} // namespace perfev
