// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "parse_config.hpp"
#include "peres_def.hpp"
#include "perf.hpp"
#include "perf_ringbuffer.hpp"
#include "record_header.hpp"
#include "record_types.hpp"
#include "sample_id.hpp"
#include "sampler_options.hpp"
#include "unique_fd.hpp"
#include "user_read.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <sys/types.h>
#include <vector>

namespace perfev {

class Sampler;

/// One record of the ring buffer. The record bytes stay in the ring buffer
/// (no copy) until the view is released, which happens at the latest when
/// the view is destroyed. A sampler hands out one view at a time.
/// A view left over when its sampler is destroyed is detached: it reports
/// released() and its bytes can no longer be read.
class RecordView {
public:
  RecordView(RecordView &&other) noexcept { swap(*this, other); }
  RecordView &operator=(RecordView &&other) noexcept {
    release();
    swap(*this, other);
    return *this;
  }
  RecordView(const RecordView &) = delete;
  RecordView &operator=(const RecordView &) = delete;

  ~RecordView() { release(); }

  [[nodiscard]] uint32_t type() const { return _header.type; }
  [[nodiscard]] uint16_t misc() const { return _header.misc; }
  // size declared in the header (header included)
  [[nodiscard]] uint16_t size() const { return _header.size; }
  [[nodiscard]] const RecordHeader &header() const { return _header; }

  /// Bytes following the header: one span, or two when the record wraps
  /// around the end of the ring buffer
  [[nodiscard]] const ByteCursor &data() const { return _body; }
  [[nodiscard]] std::vector<std::byte> to_vector() const {
    return _body.to_vector();
  }
  ConstBuffer to_contiguous(std::vector<std::byte> &storage) const {
    return _body.to_contiguous(storage);
  }

  /// Decode the record. A failure is a warning unless the sampler uses
  /// strict decoding, in which case the sampler is stopped.
  PERes parse_record(Record *record) const;

  /// Decode the sample_id of the record (empty when the counter was not
  /// opened with sample_id_all, and for MMAP records)
  PERes parse_sample_id(SampleId *sample_id) const;

  /// Give the record bytes back to the kernel. Views must not be read
  /// after this call.
  void release();

  [[nodiscard]] bool released() const { return _sampler == nullptr; }

private:
  friend class Sampler;
  RecordView(Sampler *sampler, const RecordHeader &header,
             const ByteCursor &body)
      : _sampler(sampler), _header(header), _body(body) {
    attach();
  }

  // keeps the sampler pointing at the view that holds the record
  static void swap(RecordView &first, RecordView &second) noexcept;
  void attach() noexcept;
  void detach() noexcept;

  PERes decode_failure(PERes res) const;

  Sampler *_sampler{nullptr};
  RecordHeader _header{};
  ByteCursor _body;
};

/// Reads the records of a perf counter from its ring buffer. Not thread
/// safe: a single thread consumes the records of a sampler.
class Sampler {
public:
  /// Use an existing mapping. `fd` and the mapping must outlive the sampler.
  /// Throws PEException if the mapping does not look like a perf ring buffer.
  Sampler(int fd, void *region, size_t region_size, const ParseConfig &config,
          const SamplerOptions &options = {});

  /// Take ownership of the counter and of its mapping
  Sampler(UniqueFd fd, PerfMapping mapping, const ParseConfig &config,
          const SamplerOptions &options = {});

  ~Sampler();

  // the ring buffer reader refers to the sampler's own state
  Sampler(const Sampler &) = delete;
  Sampler &operator=(const Sampler &) = delete;
  Sampler(Sampler &&) = delete;
  Sampler &operator=(Sampler &&) = delete;

  /// Open a counter described by `attr` and map 2^buf_size_shift data pages
  static PERes open(perf_event_attr *attr, pid_t pid, int cpu,
                    int buf_size_shift, const SamplerOptions &options,
                    std::unique_ptr<Sampler> *sampler);

  /// Non blocking. `record` is left empty when nothing is available.
  /// A view held in `record` is released before looking for the next record.
  PERes next_record(std::optional<RecordView> *record);

  /// Wait up to `timeout` (forever when not set) for a record.
  /// `record` is left empty on timeout.
  PERes next_record_blocking(std::optional<std::chrono::milliseconds> timeout,
                             std::optional<RecordView> *record);

  /// Counter value read from user space through the metadata page
  PERes read_user(UserReadData *data) const;

  [[nodiscard]] int fd() const { return _fd; }
  [[nodiscard]] const ParseConfig &config() const { return _config; }
  [[nodiscard]] const SamplerOptions &options() const { return _options; }
  [[nodiscard]] const perf_event_mmap_page *page() const { return _rb.meta; }
  // set after a stream level error, no record can be read anymore
  [[nodiscard]] bool failed() const { return _failed; }
  [[nodiscard]] bool record_in_flight() const { return _view != nullptr; }

private:
  friend class RecordView;

  void release_record(size_t size);
  PERes fail(PERes res);

  UniqueFd _owned_fd;
  PerfMapping _mapping;
  int _fd;
  RingBuffer _rb;
  PerfRingBufferReader _reader;
  ParseConfig _config;
  SamplerOptions _options;
  // view holding the unreleased record, if any
  RecordView *_view{nullptr};
  bool _failed{false};
};

} // namespace perfev
