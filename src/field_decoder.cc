// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "field_decoder.hpp"

namespace perfev {

namespace {
RecordHeader header_from_raw(const std::array<std::byte, k_record_header_size> &raw) {
  RecordHeader header;
  memcpy(&header.type, raw.data(), sizeof(header.type));
  memcpy(&header.misc, raw.data() + 4, sizeof(header.misc));
  memcpy(&header.size, raw.data() + 6, sizeof(header.size));
  return header;
}
} // namespace

PERes read_header(ByteCursor &cursor, RecordHeader *header) {
  std::array<std::byte, k_record_header_size> raw;
  PERes const res = cursor.copy_into(raw);
  if (IsPEResOK(res)) {
    *header = header_from_raw(raw);
  }
  return res;
}

PERes peek_header(const ByteCursor &cursor, RecordHeader *header) {
  std::array<std::byte, k_record_header_size> raw;
  PERes const res = cursor.peek_into(raw);
  if (IsPEResOK(res)) {
    *header = header_from_raw(raw);
  }
  return res;
}

PERes read_bytes(ByteCursor &cursor, uint64_t len, std::vector<std::byte> *out) {
  // a corrupted length must not turn into a huge allocation
  if (unlikely(len > cursor.remaining_len())) {
    return peres_warn(PE_WHAT_BAD_LENGTH);
  }
  out->resize(len);
  return cursor.copy_into(*out);
}

PERes read_u64_values(ByteCursor &cursor, uint64_t count,
                      std::vector<uint64_t> *out) {
  if (unlikely(count > cursor.remaining_len() / sizeof(uint64_t))) {
    return peres_warn(PE_WHAT_EOD);
  }
  out->resize(count);
  return cursor.copy_into(std::as_writable_bytes(std::span{*out}));
}

PERes read_u64_array(ByteCursor &cursor, std::vector<uint64_t> *out) {
  uint64_t nr = 0;
  PERes const res = read_u64(cursor, &nr);
  if (IsPEResNotOK(res)) {
    return res;
  }
  return read_u64_values(cursor, nr, out);
}

PERes read_length_prefixed(ByteCursor &cursor, std::vector<std::byte> *out) {
  uint64_t len = 0;
  PERes const res = read_u64(cursor, &len);
  if (IsPEResNotOK(res)) {
    return res;
  }
  return read_bytes(cursor, len, out);
}

PERes read_length_prefixed_u32(ByteCursor &cursor,
                               std::vector<std::byte> *out) {
  uint32_t len = 0;
  PERes const res = read_u32(cursor, &len);
  if (IsPEResNotOK(res)) {
    return res;
  }
  return read_bytes(cursor, len, out);
}

PERes read_remainder(ByteCursor &cursor, std::vector<std::byte> *out) {
  return read_bytes(cursor, cursor.remaining_len(), out);
}

PERes read_string_remainder(ByteCursor &cursor, std::string *out) {
  std::vector<std::byte> raw;
  PERes const res = read_remainder(cursor, &raw);
  if (IsPEResNotOK(res)) {
    return res;
  }
  size_t len = raw.size();
  while (len > 0 && raw[len - 1] == std::byte{0}) {
    --len;
  }
  out->assign(reinterpret_cast<const char *>(raw.data()), len);
  return {};
}

} // namespace perfev
