// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "loghandle.hpp"
#include "peres.hpp"
#include "user_read.hpp"

namespace perfev {

namespace {
perf_event_mmap_page *s_page = nullptr;
uint32_t s_pmc_idx = 0;
uint64_t s_pmc_value = 0;
uint64_t s_tsc_value = 0;
int s_lock_bumps = 0;

uint64_t fake_read_pmc(uint32_t idx) {
  s_pmc_idx = idx;
  if (s_lock_bumps != 0) {
    // the kernel updates the page in the middle of the read
    ++s_page->lock;
    if (s_lock_bumps > 0) {
      --s_lock_bumps;
    }
  }
  return s_pmc_value;
}

uint64_t fake_read_tsc() { return s_tsc_value; }

constexpr UserReadHooks k_fake_hooks = {.read_pmc = fake_read_pmc,
                                        .read_tsc = fake_read_tsc};

class UserReadTest : public ::testing::Test {
protected:
  void SetUp() override {
    _page = {};
    s_page = &_page;
    s_pmc_idx = 0;
    s_pmc_value = 0;
    s_tsc_value = 0;
    s_lock_bumps = 0;
  }

  perf_event_mmap_page _page;
};
} // namespace

TEST_F(UserReadTest, PageValuesOnly) {
  _page.time_enabled = 1000;
  _page.time_running = 500;
  UserReadData data;
  ASSERT_TRUE(IsPEResOK(read_user(&_page, k_fake_hooks, &data)));
  EXPECT_EQ(data.time_enabled, 1000);
  EXPECT_EQ(data.time_running, 500);
  EXPECT_FALSE(data.count);
  EXPECT_FALSE(data.scaled_count());
}

TEST_F(UserReadTest, CounterIsSignExtended) {
  _page.cap_user_rdpmc = 1;
  _page.index = 3;
  _page.pmc_width = 48;
  _page.offset = 100;
  // -5 on 48 bits
  s_pmc_value = (1ULL << 48) - 5;
  UserReadData data;
  ASSERT_TRUE(IsPEResOK(read_user(&_page, k_fake_hooks, &data)));
  EXPECT_EQ(s_pmc_idx, 2);
  EXPECT_EQ(data.count, 95);
}

TEST_F(UserReadTest, NoCounterIndex) {
  _page.cap_user_rdpmc = 1;
  _page.index = 0;
  _page.cap_user_time = 1;
  _page.time_enabled = 10;
  s_tsc_value = 1000000;
  UserReadData data;
  ASSERT_TRUE(IsPEResOK(read_user(&_page, k_fake_hooks, &data)));
  EXPECT_FALSE(data.count);
  // the counter is stopped, times are up to date
  EXPECT_EQ(data.time_enabled, 10);
}

TEST_F(UserReadTest, TimeFromTsc) {
  _page.cap_user_rdpmc = 1;
  _page.cap_user_time = 1;
  _page.index = 1;
  _page.pmc_width = 64;
  _page.time_enabled = 1000;
  _page.time_running = 800;
  _page.time_offset = 7;
  _page.time_mult = 3;
  _page.time_shift = 1;
  s_tsc_value = 101;
  UserReadData data;
  ASSERT_TRUE(IsPEResOK(read_user(&_page, k_fake_hooks, &data)));
  // quot = 50, rem = 1: delta = 7 + 50 * 3 + ((1 * 3) >> 1)
  uint64_t const delta = 7 + 150 + 1;
  EXPECT_EQ(data.time_enabled, 1000 + delta);
  EXPECT_EQ(data.time_running, 800 + delta);
}

TEST_F(UserReadTest, ShortTimeCycles) {
  _page.cap_user_rdpmc = 1;
  _page.cap_user_time = 1;
  _page.cap_user_time_short = 1;
  _page.index = 1;
  _page.pmc_width = 64;
  _page.time_mult = 1;
  _page.time_shift = 0;
  _page.time_cycles = 0x1000;
  _page.time_mask = 0xff;
  s_tsc_value = 0x12345;
  UserReadData data;
  ASSERT_TRUE(IsPEResOK(read_user(&_page, k_fake_hooks, &data)));
  // cycles = 0x1000 + ((0x12345 - 0x1000) & 0xff)
  EXPECT_EQ(data.time_enabled, 0x1000 + 0x45);
}

TEST_F(UserReadTest, RetryWhenPageChanges) {
  _page.cap_user_rdpmc = 1;
  _page.index = 1;
  _page.pmc_width = 64;
  s_pmc_value = 42;
  s_lock_bumps = 3;
  UserReadData data;
  ASSERT_TRUE(IsPEResOK(read_user(&_page, k_fake_hooks, &data)));
  EXPECT_EQ(data.count, 42);
  EXPECT_EQ(_page.lock, 3);
}

TEST_F(UserReadTest, GiveUpWhenPageKeepsChanging) {
  LogHandle handle(LL_ERROR);
  _page.cap_user_rdpmc = 1;
  _page.index = 1;
  s_lock_bumps = -1;
  UserReadData data;
  EXPECT_EQ(read_user(&_page, k_fake_hooks, &data),
            peres_warn(PE_WHAT_USERREAD));
}

TEST(UserReadData, ScaledCount) {
  UserReadData data;
  data.time_enabled = 300;
  data.time_running = 100;
  data.count = 1000;
  EXPECT_EQ(data.scaled_count(), 3000);
  data.time_running = 0;
  EXPECT_EQ(data.scaled_count(), 0);
}

} // namespace perfev
