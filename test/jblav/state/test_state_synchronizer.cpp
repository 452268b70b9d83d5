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
#include <string>
#include <vector>

#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/state/state_synchronizer.hpp"

using namespace jblav::state;
using namespace jblav::protocol;

class StateSynchronizerTest : public ::testing::Test
{
protected:
  StateSynchronizer sync_;
  std::vector<StateEvent> events_;

  void SetUp() override
  {
    sync_.subscribe([this](const StateEvent & e) {events_.push_back(e);});
  }

  ResponseFrame rejection(CommandId command)
  {
    ResponseFrame frame;
    frame.command = command;
    frame.code = ResponseCode::PARAMETER_NOT_RECOGNIZED;
    return frame;
  }
};

TEST_F(StateSynchronizerTest, StatusFrameUpdatesStateAndEmitsDelta) {
  EXPECT_TRUE(sync_.applyFrame(makeStatus(CommandId::VOLUME, {30})));
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].kind, StateEvent::Kind::Delta);
  ASSERT_EQ(events_[0].changes.size(), 1u);
  EXPECT_EQ(events_[0].changes[0].field, Field::Volume);
  EXPECT_EQ(events_[0].changes[0].value, 30);
  EXPECT_EQ(sync_.snapshot().volume, 30);
}

TEST_F(StateSynchronizerTest, RepeatedValueIsSilent) {
  sync_.applyFrame(makeStatus(CommandId::MUTE, {1}));
  EXPECT_FALSE(sync_.applyFrame(makeStatus(CommandId::MUTE, {1})));
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(StateSynchronizerTest, DeviceReportWinsOverOptimisticValue) {
  sync_.applyFrame(makeStatus(CommandId::VOLUME, {20}));
  sync_.applyOptimistic(Axis::Volume, 35);
  EXPECT_EQ(sync_.snapshot().volume, 35);
  EXPECT_EQ(sync_.confirmed().volume, 20);
  EXPECT_TRUE(sync_.hasOptimistic(Axis::Volume));

  // The device clamped the request
  EXPECT_TRUE(sync_.reconcile(Axis::Volume, makeStatus(CommandId::VOLUME, {30})));
  EXPECT_EQ(sync_.snapshot().volume, 30);
  EXPECT_FALSE(sync_.hasOptimistic(Axis::Volume));
  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[2].changes[0].value, 30);
}

TEST_F(StateSynchronizerTest, ReconcileIgnoresOtherAxis) {
  sync_.applyOptimistic(Axis::Volume, 35);
  EXPECT_FALSE(sync_.reconcile(Axis::Volume, makeStatus(CommandId::MUTE, {1})));
  EXPECT_TRUE(sync_.hasOptimistic(Axis::Volume));
  EXPECT_FALSE(sync_.snapshot().mute.has_value());
}

TEST_F(StateSynchronizerTest, RevertRestoresConfirmedValue) {
  sync_.applyFrame(makeStatus(CommandId::INPUT_SOURCE, {2}));
  sync_.applyOptimistic(Axis::Input, 5);
  sync_.revertOptimistic(Axis::Input);
  EXPECT_EQ(sync_.snapshot().input, InputSource::HDMI_1);
  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[2].changes[0].text, "HDMI 1");

  // Nothing to revert
  sync_.revertOptimistic(Axis::Input);
  EXPECT_EQ(events_.size(), 3u);
}

TEST_F(StateSynchronizerTest, ErrorFramesLeaveStateAlone) {
  sync_.applyFrame(makeStatus(CommandId::VOLUME, {30}));
  EXPECT_FALSE(sync_.applyFrame(rejection(CommandId::VOLUME)));
  EXPECT_EQ(sync_.snapshot().volume, 30);
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(StateSynchronizerTest, GarbageOperandIsIgnored) {
  EXPECT_FALSE(sync_.applyFrame(makeStatus(CommandId::VOLUME, {0xF0})));
  EXPECT_FALSE(sync_.applyFrame(makeStatus(CommandId::MUTE, {1, 0})));
  EXPECT_TRUE(events_.empty());
}

TEST_F(StateSynchronizerTest, MetadataFrames) {
  sync_.applyFrame(makeStatus(CommandId::INITIALIZATION, {0x03}));
  sync_.applyFrame(makeStatus(CommandId::VERSION, {1, 7}));
  sync_.applyFrame(makeStatus(CommandId::STREAMING_STATE, {1}));
  sync_.applyFrame(makeStatus(CommandId::TREBLE_EQ, {4}));

  auto s = sync_.snapshot();
  EXPECT_EQ(s.model, Model::MA7100HP);
  EXPECT_EQ(s.version, std::string("1.7"));
  EXPECT_EQ(s.streaming_state, 1);
  EXPECT_EQ(s.treble_db, -2);

  EXPECT_FALSE(sync_.applyFrame(makeStatus(CommandId::HEARTBEAT, {})));
  EXPECT_EQ(events_.size(), 4u);
}

TEST_F(StateSynchronizerTest, MarkUnknownEmitsOneSnapshot) {
  sync_.onConnected();
  sync_.applyFrame(makeStatus(CommandId::POWER, {1}));
  sync_.applyFrame(makeStatus(CommandId::VOLUME, {30}));
  sync_.applyOptimistic(Axis::Mute, 1);
  events_.clear();

  sync_.markUnknown();
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].kind, StateEvent::Kind::Snapshot);
  EXPECT_EQ(events_[0].changes.size(), 19u);
  EXPECT_EQ(events_[0].state, ReceiverState{});
  EXPECT_FALSE(sync_.hasOptimistic(Axis::Mute));
}

TEST_F(StateSynchronizerTest, ConnectedSnapshot) {
  sync_.onConnected();
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].kind, StateEvent::Kind::Snapshot);
  EXPECT_TRUE(events_[0].state.connected);
  EXPECT_EQ(events_[0].changes[0].text, "yes");
}

TEST_F(StateSynchronizerTest, LimitedControlShowsGreenStandby) {
  sync_.applyFrame(makeStatus(CommandId::POWER, {1}));
  sync_.applyOptimistic(Axis::Power, 0);
  sync_.setLimitedControl(true);

  auto s = sync_.snapshot();
  EXPECT_TRUE(s.limited_control);
  EXPECT_EQ(s.power, PowerState::GreenStandby);
  EXPECT_FALSE(sync_.hasOptimistic(Axis::Power));

  // Survives the link going away
  sync_.markUnknown();
  EXPECT_EQ(sync_.snapshot().power, PowerState::GreenStandby);

  sync_.setLimitedControl(false);
  EXPECT_FALSE(sync_.snapshot().limited_control);
  EXPECT_FALSE(sync_.snapshot().power.has_value());
}

TEST_F(StateSynchronizerTest, PowerReportClearsLimitedControl) {
  sync_.setLimitedControl(true);
  sync_.applyFrame(makeStatus(CommandId::POWER, {0}));
  auto s = sync_.snapshot();
  EXPECT_FALSE(s.limited_control);
  EXPECT_EQ(s.power, PowerState::Standby);
}

TEST_F(StateSynchronizerTest, UnsubscribedListenerIsNotCalled) {
  int calls = 0;
  auto id = sync_.subscribe([&](const StateEvent &) {++calls;});
  sync_.applyFrame(makeStatus(CommandId::MUTE, {1}));
  sync_.unsubscribe(id);
  sync_.applyFrame(makeStatus(CommandId::MUTE, {0}));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(events_.size(), 2u);
}
