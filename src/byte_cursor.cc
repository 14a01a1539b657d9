// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "byte_cursor.hpp"

#include "peres_list.hpp"

#include <algorithm>
#include <cstring>

namespace perfev {

PERes ByteCursor::peek_into(Buffer dst) const {
  if (unlikely(dst.size() > remaining_len())) {
    return peres_warn(PE_WHAT_EOD);
  }
  size_t const from_first = std::min(dst.size(), _first.size());
  if (from_first) {
    memcpy(dst.data(), _first.data(), from_first);
  }
  if (from_first < dst.size()) {
    memcpy(dst.data() + from_first, _second.data(), dst.size() - from_first);
  }
  return {};
}

PERes ByteCursor::copy_into(Buffer dst) {
  if (unlikely(dst.size() > remaining_len())) {
    return peres_warn(PE_WHAT_EOD);
  }
  // peek can not fail past the length check
  (void)peek_into(dst);
  return skip(dst.size());
}

PERes ByteCursor::skip(size_t n) {
  if (unlikely(n > remaining_len())) {
    return peres_warn(PE_WHAT_EOD);
  }
  if (n < _first.size()) {
    _first = _first.subspan(n);
    return {};
  }
  _second = _second.subspan(n - _first.size());
  _first = {};
  normalize();
  return {};
}

PERes ByteCursor::truncate(size_t new_len) {
  if (unlikely(new_len > remaining_len())) {
    return peres_warn(PE_WHAT_BAD_LENGTH);
  }
  if (new_len <= _first.size()) {
    _first = _first.first(new_len);
    _second = {};
  } else {
    _second = _second.first(new_len - _first.size());
  }
  return {};
}

std::vector<std::byte> ByteCursor::to_vector() const {
  std::vector<std::byte> out;
  out.reserve(remaining_len());
  out.insert(out.end(), _first.begin(), _first.end());
  out.insert(out.end(), _second.begin(), _second.end());
  return out;
}

ConstBuffer ByteCursor::to_contiguous(std::vector<std::byte> &storage) const {
  if (!is_split()) {
    return _first;
  }
  storage = to_vector();
  return {storage.data(), storage.size()};
}

} // namespace perfev
