// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "byte_cursor.hpp"
#include "field_decoder.hpp"
#include "peres.hpp"
#include "record_builder.hpp"

#include <string>
#include <string_view>

namespace perfev {

namespace {
ConstBuffer to_buffer(std::string_view str) {
  return as_bytes(str.data(), str.size());
}

std::string to_str(const std::vector<std::byte> &bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}
} // namespace

TEST(ByteCursor, CopyAcrossSplit) {
  ByteCursor cursor(to_buffer("aaaaaa"), to_buffer("bbbbb"));
  EXPECT_TRUE(cursor.is_split());
  EXPECT_EQ(cursor.remaining_len(), 11);

  std::vector<std::byte> dst(7);
  ASSERT_TRUE(IsPEResOK(cursor.copy_into(dst)));
  EXPECT_EQ(to_str(dst), "aaaaaab");
  EXPECT_EQ(cursor.remaining_len(), 4);
  EXPECT_FALSE(cursor.is_split());
  EXPECT_EQ(to_str(cursor.to_vector()), "bbbb");
}

TEST(ByteCursor, ShortReadConsumesNothing) {
  ByteCursor cursor(to_buffer("abc"), to_buffer("de"));
  std::vector<std::byte> dst(6);
  PERes const res = cursor.copy_into(dst);
  EXPECT_EQ(res, peres_warn(PE_WHAT_EOD));
  EXPECT_EQ(cursor.remaining_len(), 5);
  EXPECT_EQ(to_str(cursor.to_vector()), "abcde");

  EXPECT_EQ(cursor.skip(6), peres_warn(PE_WHAT_EOD));
  EXPECT_EQ(cursor.remaining_len(), 5);
}

TEST(ByteCursor, EmptyFirstSpanIsNormalized) {
  ByteCursor cursor(ConstBuffer{}, to_buffer("xyz"));
  EXPECT_FALSE(cursor.is_split());
  EXPECT_EQ(cursor.first().size(), 3);
}

TEST(ByteCursor, Peek) {
  ByteCursor const cursor(to_buffer("ab"), to_buffer("cd"));
  std::vector<std::byte> dst(3);
  ASSERT_TRUE(IsPEResOK(cursor.peek_into(dst)));
  EXPECT_EQ(to_str(dst), "abc");
  EXPECT_EQ(cursor.remaining_len(), 4);
}

TEST(ByteCursor, SkipIntoSecondSpan) {
  ByteCursor cursor(to_buffer("abcd"), to_buffer("efgh"));
  ASSERT_TRUE(IsPEResOK(cursor.skip(4)));
  EXPECT_FALSE(cursor.is_split());
  EXPECT_EQ(to_str(cursor.to_vector()), "efgh");
  ASSERT_TRUE(IsPEResOK(cursor.skip(2)));
  EXPECT_EQ(to_str(cursor.to_vector()), "gh");
  ASSERT_TRUE(IsPEResOK(cursor.skip(2)));
  EXPECT_TRUE(cursor.empty());
}

TEST(ByteCursor, Truncate) {
  {
    ByteCursor cursor(to_buffer("abcd"), to_buffer("efgh"));
    ASSERT_TRUE(IsPEResOK(cursor.truncate(6)));
    EXPECT_EQ(to_str(cursor.to_vector()), "abcdef");
    EXPECT_TRUE(cursor.is_split());
  }
  {
    ByteCursor cursor(to_buffer("abcd"), to_buffer("efgh"));
    ASSERT_TRUE(IsPEResOK(cursor.truncate(3)));
    EXPECT_EQ(to_str(cursor.to_vector()), "abc");
    EXPECT_FALSE(cursor.is_split());
  }
  {
    ByteCursor cursor(to_buffer("abcd"));
    EXPECT_EQ(cursor.truncate(5), peres_warn(PE_WHAT_BAD_LENGTH));
    EXPECT_EQ(cursor.remaining_len(), 4);
  }
}

TEST(ByteCursor, ToContiguous) {
  std::vector<std::byte> storage;
  {
    ByteCursor const cursor(to_buffer("abcd"));
    ConstBuffer const view = cursor.to_contiguous(storage);
    EXPECT_EQ(view.data(), cursor.first().data());
    EXPECT_TRUE(storage.empty());
  }
  {
    ByteCursor const cursor(to_buffer("ab"), to_buffer("cd"));
    ConstBuffer const view = cursor.to_contiguous(storage);
    EXPECT_EQ(view.size(), 4);
    EXPECT_EQ(to_str(storage), "abcd");
  }
}

// Every split position decodes to the same values as the contiguous bytes
TEST(ByteCursor, SplitEquivalence) {
  RecordBuilder builder;
  builder.add_u64(0x0102030405060708)
      .add_u32(0xdeadbeef)
      .add_u16(0xcafe)
      .add_u16(0x1234)
      .add_u64(0xfedcba9876543210);

  auto decode = [](ByteCursor cursor) {
    uint64_t a = 0;
    uint32_t b = 0;
    uint16_t c = 0;
    uint16_t d = 0;
    uint64_t e = 0;
    EXPECT_TRUE(IsPEResOK(read_u64(cursor, &a)));
    EXPECT_TRUE(IsPEResOK(read_u32(cursor, &b)));
    EXPECT_TRUE(IsPEResOK(read_u16(cursor, &c)));
    EXPECT_TRUE(IsPEResOK(read_u16(cursor, &d)));
    EXPECT_TRUE(IsPEResOK(read_u64(cursor, &e)));
    EXPECT_TRUE(cursor.empty());
    return std::vector<uint64_t>{a, b, c, d, e};
  };

  std::vector<uint64_t> const expected = decode(builder.cursor());
  EXPECT_EQ(expected[0], 0x0102030405060708);
  EXPECT_EQ(expected[4], 0xfedcba9876543210);
  for (size_t split = 0; split <= builder.size(); ++split) {
    EXPECT_EQ(decode(builder.split_cursor(split)), expected)
        << "split at " << split;
  }
}

} // namespace perfev
