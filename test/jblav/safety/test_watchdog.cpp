/*
 * Copyright (c) 2026 JBL AV Bridge Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "jblav_utils/safety/watchdog.hpp"
using jblav::safety::Watchdog;
using namespace std::chrono_literals;

#include <chrono>

#include <gtest/gtest.h>


TEST(WatchdogTest, TripsAfterIdleWindow) {
  Watchdog watchdog(30000ms);
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  ASSERT_FALSE(watchdog.tripped(start_time));
  ASSERT_FALSE(watchdog.tripped(start_time + 29s));
  // Exactly at the limit is still alive
  ASSERT_FALSE(watchdog.tripped(start_time + 30s));
  ASSERT_TRUE(watchdog.tripped(start_time + 30001ms));
}

TEST(WatchdogTest, ValidFrameRestartsWindow) {
  Watchdog watchdog(50ms);
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  auto time1 = start_time + 30ms;
  watchdog.updateOnValidFrame(time1);
  ASSERT_FALSE(watchdog.tripped(time1 + 30ms));
  ASSERT_TRUE(watchdog.tripped(time1 + 60ms));
  EXPECT_EQ(watchdog.lastValidFrame(), time1);
}

TEST(WatchdogTest, TripLatchesUntilFrameOrReset) {
  Watchdog watchdog(50ms);
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  ASSERT_TRUE(watchdog.tripped(start_time + 60ms));
  // Asking with an earlier time does not clear it
  ASSERT_TRUE(watchdog.tripped(start_time + 10ms));

  watchdog.updateOnValidFrame(start_time + 70ms);
  ASSERT_FALSE(watchdog.tripped(start_time + 80ms));

  ASSERT_TRUE(watchdog.tripped(start_time + 200ms));
  watchdog.reset(start_time + 200ms);
  ASSERT_FALSE(watchdog.tripped(start_time + 220ms));
  EXPECT_EQ(watchdog.timeout(), 50ms);
}
