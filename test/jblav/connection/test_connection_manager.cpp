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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

#include "jblav_utils/connection/connection_manager.hpp"
#include "jblav_utils/errors.hpp"
#include "jblav_utils/scheduling/manual_scheduler.hpp"
#include "jblav_utils/transport/loopback_transport.hpp"
#include "mock_transport.hpp"

using namespace jblav::connection;
using namespace jblav::protocol;
using jblav::ConnectionLostError;
using jblav::NotConnectedError;
using jblav::scheduling::ManualScheduler;
using jblav::transport::LoopbackTransport;
using jblav::transport::OpenResult;
using jblav::transport::Transport;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using namespace std::chrono_literals;

using Event = std::pair<ConnectionState, ConnectionReason>;

ConnectionOptions testOptions()
{
  ConnectionOptions opts;
  opts.host = "loopback";
  opts.read_timeout_ms = 0;
  opts.heartbeat_interval = 10s;
  opts.idle_timeout = 30s;
  opts.backoff.initial = 1000ms;
  opts.backoff.max = 30000ms;
  opts.backoff.jitter = 0.0;
  opts.backoff_seed = 1;
  opts.spawn_reader_thread = false;
  return opts;
}

class ConnectionManagerTest : public ::testing::Test
{
protected:
  ManualScheduler sched_;
  LoopbackTransport * loop_ = nullptr;
  std::unique_ptr<ConnectionManager> mgr_;
  std::vector<Event> events_;
  std::vector<ResponseFrame> frames_;
  std::vector<OpenResult> attempts_;

  void SetUp() override
  {
    auto loop = std::make_unique<LoopbackTransport>();
    loop_ = loop.get();
    mgr_ = std::make_unique<ConnectionManager>(sched_, std::move(loop), testOptions());
    mgr_->setStateHandler(
      [this](ConnectionState s, ConnectionReason r) {events_.emplace_back(s, r);});
    mgr_->setFrameHandler([this](const ResponseFrame & f) {frames_.push_back(f);});
    mgr_->setAttemptHandler([this](OpenResult r) {attempts_.push_back(r);});
  }

  void connectNow()
  {
    mgr_->start();
    sched_.runPending();
    ASSERT_TRUE(mgr_->isConnected());
  }
};

TEST_F(ConnectionManagerTest, StartConnects) {
  EXPECT_EQ(mgr_->state(), ConnectionState::Disconnected);
  connectNow();
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0], Event(ConnectionState::Connected, ConnectionReason::Connected));
  EXPECT_EQ(attempts_, (std::vector<OpenResult>{OpenResult::OK}));
  EXPECT_FALSE(mgr_->reconnectPending());
}

TEST_F(ConnectionManagerTest, RefusedConnectRetriesWithGrowingDelay) {
  loop_->setRefuseConnections(true);
  mgr_->start();
  sched_.runPending();

  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0], Event(ConnectionState::Disconnected, ConnectionReason::ConnectFailed));
  EXPECT_TRUE(mgr_->reconnectPending());
  EXPECT_EQ(mgr_->lastBackoffDelay(), 1000ms);

  sched_.advance(999ms);
  EXPECT_EQ(loop_->openCount(), 1u);
  sched_.advance(1ms);
  EXPECT_EQ(loop_->openCount(), 2u);
  EXPECT_EQ(mgr_->consecutiveFailures(), 2);
  EXPECT_EQ(mgr_->lastBackoffDelay(), 2000ms);

  loop_->setRefuseConnections(false);
  sched_.advance(2000ms);
  EXPECT_TRUE(mgr_->isConnected());
  EXPECT_EQ(mgr_->consecutiveFailures(), 0);
  EXPECT_EQ(
    attempts_,
    (std::vector<OpenResult>{OpenResult::REFUSED, OpenResult::REFUSED, OpenResult::OK}));
}

TEST(ConnectionManagerBackoff, FailedAttemptsNeverShortenTheWait) {
  ManualScheduler sched;
  auto loop = std::make_unique<LoopbackTransport>();
  loop->setRefuseConnections(true);
  ConnectionOptions opts = testOptions();
  opts.backoff.jitter = 0.2;
  opts.backoff.max = 6000ms;
  ConnectionManager mgr(sched, std::move(loop), opts);
  mgr.start();
  sched.runPending();

  std::vector<std::chrono::milliseconds> delays{mgr.lastBackoffDelay()};
  for (int i = 0; i < 4; ++i) {
    sched.advance(sched.nextDeadline() - sched.now());
    delays.push_back(mgr.lastBackoffDelay());
  }
  ASSERT_EQ(mgr.consecutiveFailures(), 5);
  // Bases 1000, 2000 and 4000 grow; from the fourth attempt on the base is at the ceiling
  for (size_t i = 1; i < 4; ++i) {
    EXPECT_GE(delays[i], delays[i - 1]);
  }
  for (size_t i = 3; i < delays.size(); ++i) {
    EXPECT_GE(delays[i], 4800ms);
    EXPECT_LE(delays[i], 6000ms);
  }
  mgr.shutdown();
}

TEST_F(ConnectionManagerTest, DeliversDecodedFrames) {
  connectNow();
  loop_->injectResponse(makeStatus(CommandId::VOLUME, {40}));
  loop_->injectResponse(makeStatus(CommandId::MUTE, {1}));
  EXPECT_EQ(mgr_->pumpOnce(), 14u);
  ASSERT_EQ(frames_.size(), 2u);
  EXPECT_EQ(frames_[0], makeStatus(CommandId::VOLUME, {40}));
  EXPECT_EQ(frames_[1], makeStatus(CommandId::MUTE, {1}));
  EXPECT_EQ(mgr_->lastActivity(), sched_.now());
}

TEST_F(ConnectionManagerTest, SendAssignsIncreasingSequence) {
  connectNow();
  EXPECT_EQ(mgr_->send(makeQuery(CommandId::POWER)), 1u);
  EXPECT_EQ(mgr_->send(makeQuery(CommandId::VOLUME)), 2u);
  EXPECT_EQ(loop_->writtenFrames().size(), 2u);
}

TEST_F(ConnectionManagerTest, SendWhileDisconnectedThrows) {
  EXPECT_THROW(mgr_->send(makeQuery(CommandId::POWER)), NotConnectedError);
  EXPECT_TRUE(loop_->writtenFrames().empty());
}

TEST_F(ConnectionManagerTest, PeerCloseTriggersReconnect) {
  connectNow();
  loop_->simulatePeerClose();
  mgr_->pumpOnce();

  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1], Event(ConnectionState::Disconnected, ConnectionReason::ConnectionLost));
  EXPECT_TRUE(mgr_->reconnectPending());

  sched_.advance(1000ms);
  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[2], Event(ConnectionState::Connected, ConnectionReason::Connected));
  EXPECT_EQ(loop_->openCount(), 2u);
}

TEST_F(ConnectionManagerTest, WriteFailureDropsSession) {
  connectNow();
  loop_->failNextWrite();
  EXPECT_THROW(mgr_->send(makeCommand(CommandId::MUTE, {1})), ConnectionLostError);
  EXPECT_FALSE(mgr_->isConnected());
  EXPECT_THROW(mgr_->send(makeCommand(CommandId::MUTE, {1})), NotConnectedError);

  sched_.runPending();
  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1], Event(ConnectionState::Disconnected, ConnectionReason::ConnectionLost));
  EXPECT_TRUE(mgr_->reconnectPending());
}

TEST_F(ConnectionManagerTest, HeartbeatIsSentOnInterval) {
  connectNow();
  sched_.advance(9s);
  EXPECT_EQ(loop_->writtenCount(CommandId::HEARTBEAT), 0u);
  sched_.advance(6s);
  EXPECT_EQ(loop_->writtenCount(CommandId::HEARTBEAT), 1u);

  mgr_->pumpOnce();
  ASSERT_EQ(frames_.size(), 1u);
  EXPECT_EQ(frames_[0].command, CommandId::HEARTBEAT);
}

TEST_F(ConnectionManagerTest, AnsweredHeartbeatsKeepLinkAlive) {
  connectNow();
  for (int i = 0; i < 12; ++i) {
    sched_.advance(7500ms);
    mgr_->pumpOnce();
  }
  EXPECT_EQ(events_.size(), 1u);
  EXPECT_TRUE(mgr_->isConnected());
  EXPECT_GE(loop_->writtenCount(CommandId::HEARTBEAT), 5u);
}

TEST_F(ConnectionManagerTest, SilentReceiverHitsIdleTimeout) {
  connectNow();
  loop_->setAutoRespond(false);
  sched_.advance(38s);

  ASSERT_GE(events_.size(), 2u);
  EXPECT_EQ(events_[1], Event(ConnectionState::Disconnected, ConnectionReason::IdleTimeout));
}

TEST_F(ConnectionManagerTest, ConnectReplacesExistingSession) {
  connectNow();
  mgr_->connect();
  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[1], Event(ConnectionState::Disconnected, ConnectionReason::ConnectionLost));
  EXPECT_EQ(events_[2], Event(ConnectionState::Connected, ConnectionReason::Connected));
  EXPECT_EQ(loop_->openCount(), 2u);
}

TEST_F(ConnectionManagerTest, ShutdownIsTerminal) {
  connectNow();
  mgr_->shutdown();
  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1], Event(ConnectionState::Disconnected, ConnectionReason::Shutdown));
  EXPECT_TRUE(mgr_->isShutdown());

  mgr_->start();
  sched_.advance(60s);
  EXPECT_EQ(loop_->openCount(), 1u);
  EXPECT_EQ(events_.size(), 2u);
  EXPECT_EQ(sched_.pending(), 0u);
}

TEST_F(ConnectionManagerTest, ShutdownDuringBackoffCancelsReconnect) {
  loop_->setRefuseConnections(true);
  mgr_->start();
  sched_.runPending();
  EXPECT_TRUE(mgr_->reconnectPending());
  mgr_->shutdown();
  EXPECT_FALSE(mgr_->reconnectPending());
  sched_.advance(10s);
  EXPECT_EQ(loop_->openCount(), 1u);
}

TEST(ConnectionManagerMock, TimedOutConnectIsReported) {
  ManualScheduler sched;
  auto mock = std::make_unique<NiceMock<MockTransport>>();
  EXPECT_CALL(*mock, open(_)).WillOnce(Return(OpenResult::TIMED_OUT));
  ConnectionManager mgr(sched, std::move(mock), testOptions());

  std::vector<OpenResult> attempts;
  std::vector<Event> events;
  mgr.setAttemptHandler([&](OpenResult r) {attempts.push_back(r);});
  mgr.setStateHandler([&](ConnectionState s, ConnectionReason r) {events.emplace_back(s, r);});
  mgr.connect();

  EXPECT_EQ(attempts, (std::vector<OpenResult>{OpenResult::TIMED_OUT}));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].second, ConnectionReason::ConnectFailed);
  mgr.shutdown();
}

TEST(ConnectionManagerMock, ReadErrorLosesConnection) {
  ManualScheduler sched;
  auto mock = std::make_unique<NiceMock<MockTransport>>();
  EXPECT_CALL(*mock, open(_)).WillOnce(Return(OpenResult::OK));
  EXPECT_CALL(*mock, read(_, _)).WillOnce(Return(Transport::kReadError));
  EXPECT_CALL(*mock, close()).Times(::testing::AtLeast(2));
  ConnectionManager mgr(sched, std::move(mock), testOptions());

  std::vector<Event> events;
  mgr.setStateHandler([&](ConnectionState s, ConnectionReason r) {events.emplace_back(s, r);});
  mgr.connect();
  EXPECT_EQ(mgr.pumpOnce(), 0u);

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1], Event(ConnectionState::Disconnected, ConnectionReason::ConnectionLost));
  mgr.shutdown();
}
