// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "field_decoder.hpp"
#include "peres.hpp"
#include "record_builder.hpp"

namespace perfev {

TEST(FieldDecoder, Integers) {
  RecordBuilder builder;
  builder.add<uint8_t>(0x7f).add_u16(0xbeef).add_u32(0x12345678).add_u64(42);
  ByteCursor cursor = builder.cursor();
  uint8_t u8;
  uint16_t u16;
  uint32_t u32;
  uint64_t u64;
  ASSERT_TRUE(IsPEResOK(read_u8(cursor, &u8)));
  ASSERT_TRUE(IsPEResOK(read_u16(cursor, &u16)));
  ASSERT_TRUE(IsPEResOK(read_u32(cursor, &u32)));
  ASSERT_TRUE(IsPEResOK(read_u64(cursor, &u64)));
  EXPECT_EQ(u8, 0x7f);
  EXPECT_EQ(u16, 0xbeef);
  EXPECT_EQ(u32, 0x12345678);
  EXPECT_EQ(u64, 42);
  EXPECT_TRUE(cursor.empty());
  EXPECT_EQ(read_u8(cursor, &u8), peres_warn(PE_WHAT_EOD));
}

TEST(FieldDecoder, Header) {
  RecordBuilder body;
  body.add_u64(1);
  std::vector<std::byte> const raw = body.record(PERF_RECORD_LOST, 0x4002);
  ByteCursor cursor{ConstBuffer(raw)};

  RecordHeader header;
  ASSERT_TRUE(IsPEResOK(peek_header(cursor, &header)));
  EXPECT_EQ(cursor.remaining_len(), 16);
  ASSERT_TRUE(IsPEResOK(read_header(cursor, &header)));
  EXPECT_EQ(header.type, PERF_RECORD_LOST);
  EXPECT_EQ(header.misc, 0x4002);
  EXPECT_EQ(header.size, 16);
  EXPECT_EQ(cursor.remaining_len(), 8);
}

TEST(FieldDecoder, HeaderTooShort) {
  RecordBuilder builder;
  builder.add_u32(PERF_RECORD_SAMPLE);
  ByteCursor cursor = builder.cursor();
  RecordHeader header;
  EXPECT_EQ(read_header(cursor, &header), peres_warn(PE_WHAT_EOD));
}

TEST(FieldDecoder, LengthPrefixed) {
  RecordBuilder builder;
  builder.add_u64(3).add_bytes("xyz").add_u32(2).add_bytes("uv");
  ByteCursor cursor = builder.cursor();
  std::vector<std::byte> blob;
  ASSERT_TRUE(IsPEResOK(read_length_prefixed(cursor, &blob)));
  EXPECT_EQ(blob.size(), 3);
  EXPECT_EQ(static_cast<char>(blob[2]), 'z');
  ASSERT_TRUE(IsPEResOK(read_length_prefixed_u32(cursor, &blob)));
  EXPECT_EQ(blob.size(), 2);
  EXPECT_TRUE(cursor.empty());
}

TEST(FieldDecoder, LengthLargerThanRecord) {
  RecordBuilder builder;
  builder.add_u64(0xffffffffffff).add_bytes("abcd");
  ByteCursor cursor = builder.cursor();
  std::vector<std::byte> blob;
  EXPECT_EQ(read_length_prefixed(cursor, &blob), peres_warn(PE_WHAT_BAD_LENGTH));
  EXPECT_TRUE(blob.empty());
}

TEST(FieldDecoder, U64Array) {
  RecordBuilder builder;
  builder.add_u64(2).add_u64(10).add_u64(20);
  ByteCursor cursor = builder.split_cursor(12);
  std::vector<uint64_t> values;
  ASSERT_TRUE(IsPEResOK(read_u64_array(cursor, &values)));
  EXPECT_EQ(values, (std::vector<uint64_t>{10, 20}));

  RecordBuilder bad;
  bad.add_u64(1000).add_u64(10);
  cursor = bad.cursor();
  EXPECT_EQ(read_u64_array(cursor, &values), peres_warn(PE_WHAT_EOD));
}

TEST(FieldDecoder, StringRemainder) {
  RecordBuilder builder;
  builder.add_string("test");
  EXPECT_EQ(builder.size(), 8);
  ByteCursor cursor = builder.cursor();
  std::string str;
  ASSERT_TRUE(IsPEResOK(read_string_remainder(cursor, &str)));
  EXPECT_EQ(str, "test");
  EXPECT_TRUE(cursor.empty());
}

} // namespace perfev
