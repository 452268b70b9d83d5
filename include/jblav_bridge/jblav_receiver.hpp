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

#ifndef JBLAV_BRIDGE__JBLAV_RECEIVER_HPP_
#define JBLAV_BRIDGE__JBLAV_RECEIVER_HPP_

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "jblav_utils/config/config.hpp"
#include "jblav_utils/connection/connection_manager.hpp"
#include "jblav_utils/dispatch/command_dispatcher.hpp"
#include "jblav_utils/latency/latency_tracker.hpp"
#include "jblav_utils/protocol/constants.hpp"
#include "jblav_utils/safety/limited_control_detector.hpp"
#include "jblav_utils/scheduling/scheduler.hpp"
#include "jblav_utils/state/state_synchronizer.hpp"
#include "jblav_utils/transport/transport.hpp"

namespace jblav_bridge
{

using jblav::dispatch::CommandOutcome;
using jblav::dispatch::CompletionHandler;

// Connection, dispatch and timing settings derived from a loaded config
jblav::connection::ConnectionOptions connectionOptionsFrom(const jblav::config::Config & cfg);
jblav::dispatch::DispatcherOptions dispatcherOptionsFrom(const jblav::config::Config & cfg);

/**
 * @brief One JBL receiver on the network
 *
 * Wires the connection manager, state synchronizer, command dispatcher and
 * green standby detector together. Frames from the socket update state or
 * complete pending commands; connection changes reset state and fail
 * pending work; every (re)connect runs the initialization handshake.
 *
 * All public methods may be called from any thread. The scheduler passed in
 * must outlive the receiver and must be stopped or drained before the
 * receiver is destroyed.
 */
class JblAvReceiver
{
public:
  JblAvReceiver(
    jblav::scheduling::Scheduler & scheduler,
    std::unique_ptr<jblav::transport::Transport> transport,
    const jblav::config::Config & cfg);
  ~JblAvReceiver();

  JblAvReceiver(const JblAvReceiver &) = delete;
  JblAvReceiver & operator=(const JblAvReceiver &) = delete;

  void start();
  // Terminal. Pending commands complete with Cancelled.
  void shutdown();

  /**
   * @brief Request a value on one axis
   *
   * @throws jblav::EncodingError if the value is out of range for the axis
   */
  void issue(jblav::state::Axis axis, int value, CompletionHandler handler = nullptr);

  void setPower(bool on, CompletionHandler handler = nullptr);
  void setVolume(int volume, CompletionHandler handler = nullptr);
  void setMute(bool muted, CompletionHandler handler = nullptr);
  void setInput(jblav::protocol::InputSource source, CompletionHandler handler = nullptr);
  void setSurroundMode(jblav::protocol::SurroundMode mode, CompletionHandler handler = nullptr);

  /**
   * @brief Step the volume relative to the newest known or requested value
   *
   * Steps from several calls accumulate into one coalesced command. While
   * the volume is unknown the steps are sent as IR volume keys instead.
   */
  void volumeUp(int steps = 1, CompletionHandler handler = nullptr);
  void volumeDown(int steps = 1, CompletionHandler handler = nullptr);

  // Fire-and-forget remote control key
  void sendIr(jblav::protocol::IrCode code);

  void query(jblav::state::Axis axis);
  // Queries model, version, every axis and the streaming state
  void refresh();
  void reboot();

  jblav::state::ReceiverState snapshot() const;
  jblav::state::StateSynchronizer::SubscriptionId subscribe(
    jblav::state::StateSynchronizer::Listener listener);
  void unsubscribe(jblav::state::StateSynchronizer::SubscriptionId id);

  jblav::connection::ConnectionState connectionState() const;
  const jblav::config::Config & config() const {return cfg_;}

  // Writes the round-trip statistics to the log
  void logLatencyStats();

  // Scheduler context only
  jblav::connection::ConnectionManager & connection() {return *connection_;}
  jblav::dispatch::CommandDispatcher & dispatcher() {return *dispatcher_;}
  const jblav::safety::LimitedControlDetector & detector() const {return detector_;}
  const jblav::latency::LatencyTracker & latency() const {return latency_;}

private:
  void onConnectionState(
    jblav::connection::ConnectionState state,
    jblav::connection::ConnectionReason reason);
  void onAttempt(jblav::transport::OpenResult result);
  void onFrame(const jblav::protocol::ResponseFrame & frame);
  void onCommandTimeout(jblav::state::Axis axis);
  // Pushes the detector flag into state when it changed
  void syncLimited(bool changed);

  void stepVolume(int delta, CompletionHandler handler);
  // Posts a frame outside the dispatcher; dropped with a warning when offline
  void post(jblav::protocol::CommandFrame frame);
  // Scheduler context; returns false if the frame could not be written
  bool sendNow(const jblav::protocol::CommandFrame & frame);
  void sendRefreshQueries();
  void runHandshake();

  jblav::scheduling::Scheduler & scheduler_;
  jblav::config::Config cfg_;

  jblav::state::StateSynchronizer sync_;
  jblav::safety::LimitedControlDetector detector_;
  jblav::latency::LatencyTracker latency_;
  uint64_t acknowledged_ = 0;

  std::unique_ptr<jblav::connection::ConnectionManager> connection_;
  std::unique_ptr<jblav::dispatch::CommandDispatcher> dispatcher_;

  std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

} // namespace jblav_bridge

#endif  // JBLAV_BRIDGE__JBLAV_RECEIVER_HPP_
