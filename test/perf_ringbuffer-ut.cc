// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "fake_ringbuffer.hpp"
#include "loghandle.hpp"
#include "peres.hpp"
#include "perf_ringbuffer.hpp"
#include "record_builder.hpp"

namespace perfev {

TEST(PerfRingBuffer, Init) {
  FakeRingBuffer fake;
  RingBuffer rb;
  ASSERT_TRUE(IsPEResOK(rb_init(&rb, fake.region(), fake.size())));
  EXPECT_EQ(rb.data_size, fake.data_size());
  EXPECT_EQ(rb.mask, fake.data_size() - 1);
  EXPECT_EQ(rb.data, static_cast<std::byte *>(fake.region()) + get_page_size());
}

TEST(PerfRingBuffer, InitLegacyLayout) {
  FakeRingBuffer fake(1);
  fake.meta()->data_offset = 0;
  fake.meta()->data_size = 0;
  RingBuffer rb;
  ASSERT_TRUE(IsPEResOK(rb_init(&rb, fake.region(), fake.size())));
  EXPECT_EQ(rb.data_size, 2 * get_page_size());
}

TEST(PerfRingBuffer, InitRejectsBadLayout) {
  LogHandle handle(LL_CRITICAL);
  FakeRingBuffer fake;
  RingBuffer rb;
  fake.meta()->data_size = fake.data_size() - 8;
  EXPECT_TRUE(IsPEResFatal(rb_init(&rb, fake.region(), fake.size())));
  fake.meta()->data_size = 2 * fake.data_size();
  EXPECT_TRUE(IsPEResFatal(rb_init(&rb, fake.region(), fake.size())));
  EXPECT_TRUE(IsPEResFatal(rb_init(&rb, nullptr, fake.size())));
}

TEST(PerfRingBuffer, EmptyAndContiguous) {
  FakeRingBuffer fake;
  RingBuffer rb;
  ASSERT_TRUE(IsPEResOK(rb_init(&rb, fake.region(), fake.size())));
  PerfRingBufferReader reader(rb);

  ByteCursor cursor;
  ASSERT_TRUE(IsPEResOK(reader.next_span(&cursor)));
  EXPECT_TRUE(cursor.empty());

  RecordBuilder builder;
  builder.add_u64(1).add_u64(2);
  fake.write(builder.body());
  ASSERT_TRUE(IsPEResOK(reader.next_span(&cursor)));
  EXPECT_EQ(cursor.remaining_len(), 16);
  EXPECT_FALSE(cursor.is_split());
  EXPECT_EQ(cursor.to_vector(), builder.body());
}

TEST(PerfRingBuffer, WrapAround) {
  FakeRingBuffer fake;
  uint64_t const start = fake.data_size() - 8;
  fake.reset_positions(start);
  RingBuffer rb;
  ASSERT_TRUE(IsPEResOK(rb_init(&rb, fake.region(), fake.size())));
  PerfRingBufferReader reader(rb);

  RecordBuilder builder;
  builder.add_u64(0x1111).add_u64(0x2222).add_u64(0x3333);
  fake.write(builder.body());

  ByteCursor cursor;
  ASSERT_TRUE(IsPEResOK(reader.next_span(&cursor)));
  EXPECT_TRUE(cursor.is_split());
  EXPECT_EQ(cursor.first().size(), 8);
  EXPECT_EQ(cursor.second().size(), 16);
  EXPECT_EQ(cursor.to_vector(), builder.body());
}

TEST(PerfRingBuffer, ReleaseIsMonotonic) {
  FakeRingBuffer fake;
  RingBuffer rb;
  ASSERT_TRUE(IsPEResOK(rb_init(&rb, fake.region(), fake.size())));
  PerfRingBufferReader reader(rb);

  RecordBuilder first;
  first.add_u64(0xaaaa);
  RecordBuilder second;
  second.add_u64(0xbbbb);
  fake.write(first.body());
  fake.write(second.body());

  ByteCursor cursor;
  ASSERT_TRUE(IsPEResOK(reader.next_span(&cursor)));
  EXPECT_EQ(cursor.remaining_len(), 16);
  reader.release(8);
  EXPECT_EQ(fake.tail(), 8);

  ASSERT_TRUE(IsPEResOK(reader.next_span(&cursor)));
  // the released bytes are never seen again
  EXPECT_EQ(cursor.to_vector(), second.body());
  reader.release(8);
  EXPECT_EQ(fake.tail(), 16);

  ASSERT_TRUE(IsPEResOK(reader.next_span(&cursor)));
  EXPECT_TRUE(cursor.empty());
}

TEST(PerfRingBuffer, HeadTooFarAhead) {
  LogHandle handle(LL_CRITICAL);
  FakeRingBuffer fake;
  RingBuffer rb;
  ASSERT_TRUE(IsPEResOK(rb_init(&rb, fake.region(), fake.size())));
  PerfRingBufferReader reader(rb);
  fake.meta()->data_head = fake.data_size() + 8;
  ByteCursor cursor;
  EXPECT_EQ(reader.next_span(&cursor), peres_error(PE_WHAT_PERFRB));
}

} // namespace perfev
