// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "peres_def.hpp"
#include "peres_list.hpp"
#include "record_header.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

// Field extraction from a ByteCursor. All values are in host byte order.
// Failures are PE_WHAT_EOD warnings: the record is lost, not the stream.

namespace perfev {

template <typename T>
  requires std::is_trivially_copyable_v<T>
PERes read_native(ByteCursor &cursor, T *out) {
  std::array<std::byte, sizeof(T)> raw;
  PERes const res = cursor.copy_into(raw);
  if (IsPEResOK(res)) {
    memcpy(out, raw.data(), sizeof(T));
  }
  return res;
}

inline PERes read_u8(ByteCursor &cursor, uint8_t *out) {
  return read_native(cursor, out);
}
inline PERes read_u16(ByteCursor &cursor, uint16_t *out) {
  return read_native(cursor, out);
}
inline PERes read_u32(ByteCursor &cursor, uint32_t *out) {
  return read_native(cursor, out);
}
inline PERes read_u64(ByteCursor &cursor, uint64_t *out) {
  return read_native(cursor, out);
}

template <size_t N>
PERes read_array(ByteCursor &cursor, std::array<std::byte, N> *out) {
  return cursor.copy_into(*out);
}

/// Header fields are decoded one by one, the record memory is never cast
PERes read_header(ByteCursor &cursor, RecordHeader *header);

/// Same as read_header without consuming the bytes
PERes peek_header(const ByteCursor &cursor, RecordHeader *header);

/// Copy exactly len bytes. The length is checked against the remaining bytes
/// before any allocation (PE_WHAT_BAD_LENGTH when it does not fit).
PERes read_bytes(ByteCursor &cursor, uint64_t len, std::vector<std::byte> *out);

/// u64 element count followed by that many u64 values
PERes read_u64_array(ByteCursor &cursor, std::vector<uint64_t> *out);

/// count u64 values (count known from the configuration)
PERes read_u64_values(ByteCursor &cursor, uint64_t count,
                      std::vector<uint64_t> *out);

/// u64 length followed by that many bytes
PERes read_length_prefixed(ByteCursor &cursor, std::vector<std::byte> *out);

/// u32 length followed by that many bytes
PERes read_length_prefixed_u32(ByteCursor &cursor,
                               std::vector<std::byte> *out);

/// Consume everything left in the cursor
PERes read_remainder(ByteCursor &cursor, std::vector<std::byte> *out);

/// Consume everything left and strip the trailing NUL bytes.
/// Strings in records are NUL padded to an 8 bytes boundary.
PERes read_string_remainder(ByteCursor &cursor, std::string *out);

} // namespace perfev
