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

#include <gtest/gtest.h>

#include "jblav_utils/errors.hpp"
#include "jblav_utils/state/axis.hpp"
#include "jblav_utils/state/receiver_state.hpp"

using namespace jblav::state;
using jblav::EncodingError;
using jblav::protocol::CommandId;
using jblav::protocol::InputSource;

TEST(Axis, EveryAxisHasItsOwnCommand) {
  for (Axis axis : kAllAxes) {
    auto back = axisForCommand(axisCommand(axis));
    ASSERT_TRUE(back.has_value()) << axisName(axis);
    EXPECT_EQ(*back, axis);
  }
  EXPECT_FALSE(axisForCommand(CommandId::HEARTBEAT).has_value());
  EXPECT_FALSE(axisForCommand(CommandId::STREAMING_STATE).has_value());
}

TEST(Axis, EqValuesCarryOffset) {
  EXPECT_EQ(encodeAxisValue(Axis::TrebleEq, -6), 0);
  EXPECT_EQ(encodeAxisValue(Axis::BassEq, 0), 6);
  EXPECT_EQ(encodeAxisValue(Axis::BassEq, 6), 12);
  EXPECT_EQ(decodeAxisValue(Axis::TrebleEq, 9), 3);
  EXPECT_FALSE(decodeAxisValue(Axis::TrebleEq, 13).has_value());
}

TEST(Axis, OutOfRangeIntentThrows) {
  EXPECT_THROW(encodeAxisValue(Axis::Volume, 100), EncodingError);
  EXPECT_THROW(encodeAxisValue(Axis::Volume, -1), EncodingError);
  EXPECT_THROW(encodeAxisValue(Axis::Input, 0), EncodingError);
  EXPECT_THROW(encodeAxisValue(Axis::TrebleEq, 7), EncodingError);
  EXPECT_THROW(encodeAxisValue(Axis::Mute, 2), EncodingError);
  EXPECT_EQ(encodeAxisValue(Axis::Volume, 99), 99);
}

TEST(Axis, StatusOperandsAreValidated) {
  EXPECT_EQ(decodeAxisValue(Axis::Volume, 35), 35);
  EXPECT_FALSE(decodeAxisValue(Axis::Volume, 0xF0).has_value());
  EXPECT_FALSE(decodeAxisValue(Axis::SurroundMode, 0).has_value());
  EXPECT_EQ(decodeAxisValue(Axis::Input, 0x0E), static_cast<int>(InputSource::NETWORK));
}

TEST(Axis, ValueText) {
  EXPECT_EQ(axisValueText(Axis::Power, 1), "on");
  EXPECT_EQ(axisValueText(Axis::Power, 2), "green standby");
  EXPECT_EQ(axisValueText(Axis::Input, 3), "HDMI 2");
  EXPECT_EQ(axisValueText(Axis::TrebleEq, 3), "+3 dB");
  EXPECT_EQ(axisValueText(Axis::BassEq, -2), "-2 dB");
  EXPECT_EQ(axisValueText(Axis::DisplayDim, 0), "off");
  EXPECT_EQ(axisValueText(Axis::Mute, 0), "off");
}

TEST(ReceiverState, AxisAccessorsAndDiff) {
  ReceiverState before;
  ReceiverState after = before;
  setAxisValue(after, Axis::Volume, 35);
  setAxisValue(after, Axis::Mute, 1);
  EXPECT_EQ(axisValue(after, Axis::Volume), 35);
  EXPECT_EQ(axisValue(after, Axis::Mute), 1);
  EXPECT_FALSE(axisValue(after, Axis::Power).has_value());

  auto changes = diffStates(before, after);
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[0].field, Field::Volume);
  EXPECT_EQ(changes[0].value, 35);
  EXPECT_EQ(changes[0].text, "35");
  EXPECT_EQ(changes[1].field, Field::Mute);

  setAxisValue(after, Axis::Volume, std::nullopt);
  changes = diffStates(before, after);
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes[0].field, Field::Mute);
}

TEST(ReceiverState, DescribeListsEveryField) {
  ReceiverState state;
  state.version = "1.7";
  auto fields = describeState(state);
  ASSERT_EQ(fields.size(), 19u);
  EXPECT_EQ(fields.front().field, Field::Connected);
  EXPECT_EQ(fields[2].text, "unknown");
  EXPECT_EQ(fields.back().field, Field::Version);
  EXPECT_EQ(fields.back().text, "1.7");
  EXPECT_FALSE(fields.back().value.has_value());
}
