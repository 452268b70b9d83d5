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

#include "jblav_bridge/jblav_receiver.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <optional>
#include <utility>

#include "rclcpp/rclcpp.hpp"

#include "jblav_utils/errors.hpp"
#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/state/axis.hpp"

namespace jblav_bridge
{

using jblav::connection::ConnectionReason;
using jblav::connection::ConnectionState;
using jblav::protocol::CommandId;
using jblav::state::Axis;

namespace
{

const rclcpp::Logger & logger()
{
  static const rclcpp::Logger l = rclcpp::get_logger("JblAvReceiver");
  return l;
}

// Acknowledged commands between two statistics lines
constexpr uint64_t LATENCY_LOG_EVERY = 20;

double toMs(jblav::latency::Duration d)
{
  return std::chrono::duration<double, std::milli>(d).count();
}

void logLatency(const jblav::latency::LatencyTracker & tracker)
{
  if (tracker.getSampleCount() == 0) {
    RCLCPP_INFO(logger(), "No acknowledged commands yet");
    return;
  }
  RCLCPP_INFO(
    logger(), "Command latency over %zu samples: p95 %.1f ms, mean %.1f ms, max %.1f ms",
    tracker.getSampleCount(), toMs(tracker.getP95Latency()),
    toMs(tracker.getMeanLatency()), toMs(tracker.getMaxLatency()));
}

void report(CompletionHandler & handler, CommandOutcome outcome)
{
  if (!handler) {
    return;
  }
  try {
    handler(outcome);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger(), "Completion handler threw: %s", e.what());
  }
}

} // namespace

jblav::connection::ConnectionOptions connectionOptionsFrom(const jblav::config::Config & cfg)
{
  jblav::connection::ConnectionOptions opts;
  opts.host = cfg.host;
  opts.connect_timeout = std::chrono::milliseconds(cfg.timing.connect_timeout_ms);
  opts.heartbeat_interval = std::chrono::milliseconds(cfg.timing.heartbeat_interval_ms);
  opts.idle_timeout = std::chrono::milliseconds(cfg.timing.idle_timeout_ms);
  opts.backoff.initial = std::chrono::milliseconds(cfg.timing.reconnect_initial_ms);
  opts.backoff.max = std::chrono::milliseconds(cfg.timing.reconnect_max_ms);
  opts.backoff.jitter = cfg.timing.reconnect_jitter;
  return opts;
}

jblav::dispatch::DispatcherOptions dispatcherOptionsFrom(const jblav::config::Config & cfg)
{
  jblav::dispatch::DispatcherOptions opts;
  opts.command_timeout = std::chrono::milliseconds(cfg.timing.command_timeout_ms);
  opts.max_retries = cfg.timing.command_retries;
  opts.coalesce_window = std::chrono::milliseconds(cfg.timing.coalesce_window_ms);
  return opts;
}

JblAvReceiver::JblAvReceiver(
  jblav::scheduling::Scheduler & scheduler,
  std::unique_ptr<jblav::transport::Transport> transport,
  const jblav::config::Config & cfg)
: scheduler_(scheduler),
  cfg_(cfg),
  detector_(jblav::safety::LimitedControlThresholds{
      cfg.limited_control.command_timeouts, cfg.limited_control.refused_connects})
{
  connection_ = std::make_unique<jblav::connection::ConnectionManager>(
    scheduler_, std::move(transport), connectionOptionsFrom(cfg_));
  dispatcher_ = std::make_unique<jblav::dispatch::CommandDispatcher>(
    scheduler_, *connection_, sync_, dispatcherOptionsFrom(cfg_));

  connection_->setFrameHandler(
    [this](const jblav::protocol::ResponseFrame & frame) {onFrame(frame);});
  connection_->setStateHandler(
    [this](ConnectionState state, ConnectionReason reason) {onConnectionState(state, reason);});
  connection_->setAttemptHandler(
    [this](jblav::transport::OpenResult result) {onAttempt(result);});

  dispatcher_->setTimeoutObserver([this](Axis axis) {onCommandTimeout(axis);});
  dispatcher_->setLatencyObservers(
    [this](uint32_t seq, jblav::scheduling::TimePoint t) {latency_.recordCommandSent(seq, t);},
    [this](uint32_t seq, jblav::scheduling::TimePoint t) {
      latency_.recordAcknowledged(seq, t);
      ++acknowledged_;
      if (cfg_.features.log_latency_stats && acknowledged_ % LATENCY_LOG_EVERY == 0) {
        logLatency(latency_);
      }
    },
    [this](uint32_t seq) {latency_.discard(seq);});
}

JblAvReceiver::~JblAvReceiver()
{
  // The dispatcher refers to the connection
  dispatcher_.reset();
  connection_.reset();
}

void JblAvReceiver::start()
{
  RCLCPP_INFO(logger(), "Starting bridge to %s (%s)", cfg_.name.c_str(), cfg_.host.c_str());
  jblav::scheduling::scheduleGuarded(
    scheduler_, alive_, jblav::scheduling::Duration::zero(),
    [this]() {connection_->start();});
}

void JblAvReceiver::shutdown()
{
  jblav::scheduling::scheduleGuarded(
    scheduler_, alive_, jblav::scheduling::Duration::zero(),
    [this]() {connection_->shutdown();});
}

void JblAvReceiver::issue(Axis axis, int value, CompletionHandler handler)
{
  dispatcher_->issue(axis, value, std::move(handler));
}

void JblAvReceiver::setPower(bool on, CompletionHandler handler)
{
  const auto power = on ? jblav::state::PowerState::On : jblav::state::PowerState::Standby;
  issue(Axis::Power, static_cast<int>(power), std::move(handler));
}

void JblAvReceiver::setVolume(int volume, CompletionHandler handler)
{
  issue(Axis::Volume, volume, std::move(handler));
}

void JblAvReceiver::setMute(bool muted, CompletionHandler handler)
{
  issue(Axis::Mute, muted ? 1 : 0, std::move(handler));
}

void JblAvReceiver::setInput(jblav::protocol::InputSource source, CompletionHandler handler)
{
  issue(Axis::Input, static_cast<int>(source), std::move(handler));
}

void JblAvReceiver::setSurroundMode(
  jblav::protocol::SurroundMode mode,
  CompletionHandler handler)
{
  issue(Axis::SurroundMode, static_cast<int>(mode), std::move(handler));
}

void JblAvReceiver::volumeUp(int steps, CompletionHandler handler)
{
  stepVolume(std::abs(steps), std::move(handler));
}

void JblAvReceiver::volumeDown(int steps, CompletionHandler handler)
{
  stepVolume(-std::abs(steps), std::move(handler));
}

void JblAvReceiver::stepVolume(int delta, CompletionHandler handler)
{
  jblav::scheduling::scheduleGuarded(
    scheduler_, alive_, jblav::scheduling::Duration::zero(),
    [this, delta, handler = std::move(handler)]() mutable {
      if (delta == 0) {
        report(handler, CommandOutcome::Acknowledged);
        return;
      }
      if (!connection_->isConnected()) {
        report(handler, CommandOutcome::NotConnected);
        return;
      }
      if (sync_.confirmed().limited_control) {
        report(handler, CommandOutcome::LimitedControl);
        return;
      }

      std::optional<int> base = dispatcher_->pendingValue(Axis::Volume);
      if (!base) {
        base = sync_.snapshot().volume;
      }
      if (base) {
        const int target = std::clamp(
          *base + delta, jblav::state::axisMinValue(Axis::Volume),
          jblav::state::axisMaxValue(Axis::Volume));
        dispatcher_->issueNow(Axis::Volume, target, std::move(handler));
        return;
      }

      // Volume unknown: let the receiver step it and report the result
      RCLCPP_DEBUG(logger(), "Volume unknown, stepping %d with IR keys", delta);
      const auto key = delta > 0 ? jblav::protocol::IrCode::VOL_UP :
        jblav::protocol::IrCode::VOL_DOWN;
      for (int i = 0; i < std::abs(delta); ++i) {
        if (!sendNow(jblav::protocol::makeIrCommand(key))) {
          report(handler, CommandOutcome::NotConnected);
          return;
        }
      }
      report(handler, CommandOutcome::Acknowledged);
    });
}

void JblAvReceiver::sendIr(jblav::protocol::IrCode code)
{
  post(jblav::protocol::makeIrCommand(code));
}

void JblAvReceiver::query(Axis axis)
{
  post(jblav::protocol::makeQuery(jblav::state::axisCommand(axis)));
}

void JblAvReceiver::refresh()
{
  jblav::scheduling::scheduleGuarded(
    scheduler_, alive_, jblav::scheduling::Duration::zero(),
    [this]() {
      if (!connection_->isConnected()) {
        RCLCPP_WARN(logger(), "Refresh skipped, not connected");
        return;
      }
      if (sendNow(
          jblav::protocol::makeCommand(CommandId::INITIALIZATION, {jblav::protocol::REQUEST_DATA})))
      {
        sendRefreshQueries();
      }
    });
}

void JblAvReceiver::reboot()
{
  RCLCPP_WARN(logger(), "Rebooting %s", cfg_.name.c_str());
  post(jblav::protocol::makeCommand(CommandId::REBOOT));
}

jblav::state::ReceiverState JblAvReceiver::snapshot() const
{
  return sync_.snapshot();
}

jblav::state::StateSynchronizer::SubscriptionId JblAvReceiver::subscribe(
  jblav::state::StateSynchronizer::Listener listener)
{
  return sync_.subscribe(std::move(listener));
}

void JblAvReceiver::unsubscribe(jblav::state::StateSynchronizer::SubscriptionId id)
{
  sync_.unsubscribe(id);
}

ConnectionState JblAvReceiver::connectionState() const
{
  return connection_->state();
}

void JblAvReceiver::logLatencyStats()
{
  jblav::scheduling::scheduleGuarded(
    scheduler_, alive_, jblav::scheduling::Duration::zero(),
    [this]() {logLatency(latency_);});
}

void JblAvReceiver::post(jblav::protocol::CommandFrame frame)
{
  jblav::scheduling::scheduleGuarded(
    scheduler_, alive_, jblav::scheduling::Duration::zero(),
    [this, frame = std::move(frame)]() {
      if (!connection_->isConnected()) {
        RCLCPP_WARN(
          logger(), "Dropping %s, not connected", jblav::protocol::commandName(frame.command));
        return;
      }
      sendNow(frame);
    });
}

bool JblAvReceiver::sendNow(const jblav::protocol::CommandFrame & frame)
{
  try {
    connection_->send(frame);
  } catch (const jblav::JblavError & e) {
    RCLCPP_WARN(
      logger(), "Could not send %s: %s", jblav::protocol::commandName(frame.command), e.what());
    return false;
  }
  return true;
}

void JblAvReceiver::sendRefreshQueries()
{
  using jblav::protocol::makeCommand;
  using jblav::protocol::makeQuery;

  if (!sendNow(
      makeCommand(
        CommandId::VERSION,
        {static_cast<uint8_t>(jblav::protocol::VersionType::IP_CONTROL)})))
  {
    return;
  }
  for (Axis axis : jblav::state::kAllAxes) {
    if (!sendNow(makeQuery(jblav::state::axisCommand(axis)))) {
      return;
    }
  }
  sendNow(makeQuery(CommandId::STREAMING_STATE));
}

void JblAvReceiver::runHandshake()
{
  // The model comes back in the answer to INITIALIZATION
  if (!sendNow(
      jblav::protocol::makeCommand(CommandId::INITIALIZATION, {jblav::protocol::REQUEST_DATA})))
  {
    return;
  }
  if (cfg_.features.query_on_connect) {
    sendRefreshQueries();
  }
}

void JblAvReceiver::onConnectionState(ConnectionState state, ConnectionReason reason)
{
  RCLCPP_DEBUG(
    logger(), "Connection %s (%s)", jblav::connection::connectionStateName(state),
    jblav::connection::connectionReasonName(reason));

  switch (reason) {
    case ConnectionReason::Connected:
      syncLimited(detector_.onSessionEstablished());
      sync_.onConnected();
      runHandshake();
      break;
    case ConnectionReason::ConnectFailed:
      break;
    case ConnectionReason::ConnectionLost:
    case ConnectionReason::IdleTimeout:
      dispatcher_->failAll(CommandOutcome::NotConnected);
      sync_.markUnknown();
      break;
    case ConnectionReason::Shutdown:
      dispatcher_->failAll(CommandOutcome::Cancelled);
      sync_.markUnknown();
      break;
  }
}

void JblAvReceiver::onAttempt(jblav::transport::OpenResult result)
{
  if (result == jblav::transport::OpenResult::REFUSED) {
    syncLimited(detector_.onConnectRefused());
  }
}

void JblAvReceiver::onFrame(const jblav::protocol::ResponseFrame & frame)
{
  syncLimited(detector_.onFrameReceived());
  if (!dispatcher_->onFrame(frame)) {
    sync_.applyFrame(frame);
  }
}

void JblAvReceiver::onCommandTimeout(Axis axis)
{
  RCLCPP_DEBUG(logger(), "Gave up on %s", jblav::state::axisName(axis));
  syncLimited(detector_.onCommandTimeout());
}

void JblAvReceiver::syncLimited(bool changed)
{
  if (!changed) {
    return;
  }
  if (detector_.limited()) {
    RCLCPP_WARN(
      logger(), "%s stopped answering IP control, assuming green standby", cfg_.name.c_str());
  } else {
    RCLCPP_INFO(logger(), "%s is answering again, full control restored", cfg_.name.c_str());
  }
  sync_.setLimitedControl(detector_.limited());
}

} // namespace jblav_bridge
