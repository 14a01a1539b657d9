// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sampler.hpp"

#include "field_decoder.hpp"
#include "peres_exception.hpp"
#include "peres_helpers.hpp"
#include "record_catalog.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <poll.h>
#include <utility>

namespace perfev {

namespace {
RingBuffer checked_rb_init(void *region, size_t region_size) {
  RingBuffer rb{};
  PERES_CHECK_THROW_EXCEPTION(rb_init(&rb, region, region_size));
  return rb;
}
} // namespace

PERes RecordView::parse_record(Record *record) const {
  PERES_CHECK_BOOL(_sampler, PE_WHAT_ARGUMENT, "Record was already released");
  PERes const res =
      decode_record(_sampler->config(), _header, _body, record);
  if (IsPEResNotOK(res)) {
    return decode_failure(res);
  }
  return res;
}

PERes RecordView::parse_sample_id(SampleId *sample_id) const {
  PERES_CHECK_BOOL(_sampler, PE_WHAT_ARGUMENT, "Record was already released");
  PERes const res =
      decode_record_sample_id(_sampler->config(), _header, _body, sample_id);
  if (IsPEResNotOK(res)) {
    return decode_failure(res);
  }
  return res;
}

PERes RecordView::decode_failure(PERes res) const {
  if (_sampler->options().strict_decoding) {
    LG_ERR("Unable to decode %s record (size=%u) - %s",
           record_type_str(_header.type), _header.size,
           peres_error_message(res._what));
    return _sampler->fail(peres_error(res._what));
  }
  if (_sampler->options().log_skipped_records) {
    LG_WRN("Skipping %s record (size=%u) - %s", record_type_str(_header.type),
           _header.size, peres_error_message(res._what));
  }
  return res;
}

void RecordView::release() {
  if (_sampler) {
    _sampler->release_record(_header.size);
    detach();
  }
}

void RecordView::swap(RecordView &first, RecordView &second) noexcept {
  std::swap(first._sampler, second._sampler);
  std::swap(first._header, second._header);
  std::swap(first._body, second._body);
  first.attach();
  second.attach();
}

void RecordView::attach() noexcept {
  if (_sampler) {
    _sampler->_view = this;
  }
}

void RecordView::detach() noexcept {
  _sampler = nullptr;
  _body = {};
}

Sampler::Sampler(int fd, void *region, size_t region_size,
                 const ParseConfig &config, const SamplerOptions &options)
    : _fd(fd), _rb(checked_rb_init(region, region_size)), _reader(_rb),
      _config(config), _options(options) {}

Sampler::Sampler(UniqueFd fd, PerfMapping mapping, const ParseConfig &config,
                 const SamplerOptions &options)
    : _owned_fd(std::move(fd)), _mapping(std::move(mapping)),
      _fd(_owned_fd.get()),
      _rb(checked_rb_init(_mapping.get_region(), _mapping.get_sz())),
      _reader(_rb), _config(config), _options(options) {}

Sampler::~Sampler() {
  if (_view) {
    // the mapping goes away with the sampler, nothing left to give back
    _view->detach();
    _view = nullptr;
  }
}

PERes Sampler::open(perf_event_attr *attr, pid_t pid, int cpu,
                    int buf_size_shift, const SamplerOptions &options,
                    std::unique_ptr<Sampler> *sampler) {
  UniqueFd fd;
  PERES_CHECK_FWD(perf_event_open_fd(attr, pid, cpu, &fd));
  PerfMapping mapping;
  PERES_CHECK_FWD(
      PerfMapping::map(fd.get(), perf_mmap_size(buf_size_shift), &mapping));
  try {
    *sampler = std::make_unique<Sampler>(std::move(fd), std::move(mapping),
                                         ParseConfig::from_attr(*attr),
                                         options);
  }
  CatchExcept2PERes();
  return {};
}

PERes Sampler::next_record(std::optional<RecordView> *record) {
  record->reset();
  if (_failed) {
    return peres_error(PE_WHAT_SAMPLER_FAILED);
  }
  if (_view) {
    PERES_RETURN_WARN_LOG(PE_WHAT_RECORD_INFLIGHT,
                          "Previous record was not released");
  }

  ByteCursor cursor;
  PERes res = _reader.next_span(&cursor);
  if (IsPEResNotOK(res)) {
    return fail(res);
  }
  if (cursor.empty()) {
    return {};
  }

  RecordHeader header;
  res = peek_header(cursor, &header);
  if (IsPEResNotOK(res)) {
    LG_ERR("Incomplete record header (%zu bytes available)",
           cursor.remaining_len());
    return fail(peres_error(PE_WHAT_BAD_HEADER));
  }
  if (header.size < k_record_header_size) {
    LG_ERR("Record size %u is smaller than its header (type=%u)", header.size,
           header.type);
    return fail(peres_error(PE_WHAT_BAD_HEADER));
  }
  if (header.size > cursor.remaining_len()) {
    LG_ERR("Record size %u exceeds the available bytes (%zu, type=%u)",
           header.size, cursor.remaining_len(), header.type);
    return fail(peres_error(PE_WHAT_BAD_HEADER));
  }
  PERES_CHECK_FWD_STRICT(cursor.truncate(header.size));
  PERES_CHECK_FWD_STRICT(cursor.skip(k_record_header_size));

  record->emplace(RecordView(this, header, cursor));
  return {};
}

PERes Sampler::next_record_blocking(
    std::optional<std::chrono::milliseconds> timeout,
    std::optional<RecordView> *record) {
  using Clock = std::chrono::steady_clock;
  std::optional<Clock::time_point> deadline;
  if (timeout) {
    deadline = Clock::now() + *timeout;
  }

  while (true) {
    PERes const res = next_record(record);
    if (IsPEResNotOK(res) || record->has_value()) {
      return res;
    }

    int timeout_ms = -1;
    if (deadline) {
      auto const left = std::chrono::ceil<std::chrono::milliseconds>(
          *deadline - Clock::now());
      if (left.count() <= 0) {
        return {};
      }
      timeout_ms =
          static_cast<int>(std::min<int64_t>(left.count(), INT_MAX));
    }

    pollfd pfd = {.fd = _fd, .events = POLLIN, .revents = 0};
    int const ret = poll(&pfd, 1, timeout_ms);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      int const e = errno;
      LG_ERR("Unable to poll perf counter (fd=%d) - errno(%d): %s", _fd, e,
             strerror(e));
      return fail(peres_error(PE_WHAT_POLLERROR));
    }
    if (ret == 0) {
      return {};
    }
    if (pfd.revents & (POLLNVAL | POLLERR)) {
      LG_ERR("Perf counter fd=%d can not be polled (revents=%#x)", _fd,
             static_cast<unsigned>(pfd.revents));
      return fail(peres_error(PE_WHAT_POLLERROR));
    }
    if (pfd.revents & POLLHUP) {
      // the monitored task exited, records can still be pending
      return next_record(record);
    }
  }
}

PERes Sampler::read_user(UserReadData *data) const {
  return perfev::read_user(_rb.meta, data);
}

void Sampler::release_record(size_t size) {
  _reader.release(size);
  _view = nullptr;
}

PERes Sampler::fail(PERes res) {
  _failed = true;
  LOG_ERROR_DETAILS(LG_ERR, res._what);
  return res;
}

} // namespace perfev
