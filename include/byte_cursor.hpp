// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "peres_def.hpp"
#include "perfev_buffer.hpp"

#include <cstddef>
#include <vector>

namespace perfev {

/// Read cursor over a record that may wrap around the end of the ring
/// buffer. The unread bytes are either one contiguous span, or two spans
/// where the second one starts at the beginning of the data area.
/// The cursor never owns the memory it points to.
class ByteCursor {
public:
  ByteCursor() = default;
  explicit ByteCursor(ConstBuffer single) : _first(single) {}
  ByteCursor(ConstBuffer first, ConstBuffer second)
      : _first(first), _second(second) {
    normalize();
  }

  [[nodiscard]] size_t remaining_len() const {
    return _first.size() + _second.size();
  }
  [[nodiscard]] bool empty() const { return remaining_len() == 0; }
  [[nodiscard]] bool is_split() const { return !_second.empty(); }

  [[nodiscard]] ConstBuffer first() const { return _first; }
  [[nodiscard]] ConstBuffer second() const { return _second; }

  /// Copy dst.size() bytes and consume them.
  /// Fails with PE_WHAT_EOD (nothing consumed) if fewer bytes remain.
  PERes copy_into(Buffer dst);

  /// Copy dst.size() bytes without consuming them
  PERes peek_into(Buffer dst) const;

  /// Consume n bytes without copying them
  PERes skip(size_t n);

  /// Restrict the cursor to its first new_len bytes.
  /// Fails with PE_WHAT_BAD_LENGTH if new_len exceeds the remaining length.
  PERes truncate(size_t new_len);

  /// Copy of the remaining bytes (the cursor is not consumed)
  [[nodiscard]] std::vector<std::byte> to_vector() const;

  /// Remaining bytes as one span: a view when already contiguous, otherwise
  /// a copy stored in `storage`
  ConstBuffer to_contiguous(std::vector<std::byte> &storage) const;

private:
  // Keep _first non empty whenever bytes remain
  void normalize() {
    if (_first.empty()) {
      _first = _second;
      _second = {};
    }
  }

  ConstBuffer _first;
  ConstBuffer _second;
};

} // namespace perfev
