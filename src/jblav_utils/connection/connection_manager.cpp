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

#include "jblav_utils/connection/connection_manager.hpp"

#include <algorithm>
#include <exception>

#include <rclcpp/rclcpp.hpp>

#include "jblav_utils/errors.hpp"

namespace jblav
{
namespace connection
{

namespace
{

const rclcpp::Logger & logger()
{
  static const rclcpp::Logger l = rclcpp::get_logger("JblAvConnection");
  return l;
}

constexpr size_t kReadChunk = 512;

} // namespace

const char * connectionStateName(ConnectionState state)
{
  switch (state) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting: return "Connecting";
    case ConnectionState::Connected: return "Connected";
  }
  return "Unknown";
}

const char * connectionReasonName(ConnectionReason reason)
{
  switch (reason) {
    case ConnectionReason::Connected: return "connected";
    case ConnectionReason::ConnectFailed: return "connect failed";
    case ConnectionReason::ConnectionLost: return "connection lost";
    case ConnectionReason::IdleTimeout: return "idle timeout";
    case ConnectionReason::Shutdown: return "shutdown";
  }
  return "unknown";
}

ConnectionManager::ConnectionManager(
  scheduling::Scheduler & scheduler,
  std::unique_ptr<transport::Transport> transport,
  ConnectionOptions options)
: scheduler_(scheduler),
  transport_(std::move(transport)),
  options_(std::move(options)),
  backoff_(options_.backoff_seed ?
    Backoff(options_.backoff, *options_.backoff_seed) :
    Backoff(options_.backoff)),
  watchdog_(options_.idle_timeout)
{
}

ConnectionManager::~ConnectionManager()
{
  frame_handler_ = nullptr;
  state_handler_ = nullptr;
  attempt_handler_ = nullptr;
  shutdown();
}

scheduling::TaskId ConnectionManager::scheduleGuarded(
  scheduling::Duration delay,
  std::function<void ()> fn)
{
  return scheduling::scheduleGuarded(scheduler_, alive_, delay, std::move(fn));
}

void ConnectionManager::cancelTask(scheduling::TaskId & id)
{
  if (id != scheduling::kInvalidTask) {
    scheduler_.cancel(id);
    id = scheduling::kInvalidTask;
  }
}

void ConnectionManager::notify(ConnectionState state, ConnectionReason reason)
{
  if (state_handler_) {
    state_handler_(state, reason);
  }
}

void ConnectionManager::start()
{
  if (shutdown_) {
    return;
  }
  scheduleGuarded(scheduling::Duration::zero(), [this]() {connect();});
}

void ConnectionManager::connect()
{
  if (shutdown_) {
    return;
  }
  cancelTask(reconnect_task_);
  cancelTask(tick_task_);

  // At most one socket and one reader at a time
  const bool replacing = session_active_;
  session_active_ = false;
  ++generation_;
  teardown();
  if (replacing) {
    state_ = ConnectionState::Disconnected;
    notify(ConnectionState::Disconnected, ConnectionReason::ConnectionLost);
  }
  state_ = ConnectionState::Connecting;

  transport::TransportOptions topts;
  topts.host = options_.host;
  topts.port = options_.port;
  topts.connect_timeout_ms = static_cast<int>(options_.connect_timeout.count());
  topts.read_timeout_ms = options_.read_timeout_ms;
  topts.write_timeout_ms = options_.write_timeout_ms;

  RCLCPP_DEBUG(
    logger(), "Connecting to %s:%u", options_.host.c_str(),
    static_cast<unsigned>(options_.port));
  const transport::OpenResult result = transport_->open(topts);
  if (attempt_handler_) {
    attempt_handler_(result);
  }

  if (result != transport::OpenResult::OK) {
    ++consecutive_failures_;
    state_ = ConnectionState::Disconnected;
    RCLCPP_WARN(
      logger(), "Connect to %s failed (%s), attempt %d",
      options_.host.c_str(), transport::openResultName(result), consecutive_failures_);
    notify(ConnectionState::Disconnected, ConnectionReason::ConnectFailed);
    scheduleReconnect();
    return;
  }

  consecutive_failures_ = 0;
  backoff_.reset();
  ++generation_;
  decoder_.reset();
  const auto now = scheduler_.now();
  watchdog_.reset(now);
  last_activity_ = now;
  last_heartbeat_ = now;
  session_active_ = true;
  state_ = ConnectionState::Connected;

  if (options_.spawn_reader_thread) {
    startReader(generation_);
  }
  scheduleTick();

  RCLCPP_INFO(logger(), "Connected to receiver at %s", options_.host.c_str());
  notify(ConnectionState::Connected, ConnectionReason::Connected);
}

void ConnectionManager::shutdown()
{
  if (shutdown_) {
    return;
  }
  shutdown_ = true;
  cancelTask(reconnect_task_);
  cancelTask(tick_task_);
  session_active_ = false;
  ++generation_;
  teardown();
  decoder_.reset();
  state_ = ConnectionState::Disconnected;
  RCLCPP_INFO(logger(), "Connection shut down");
  notify(ConnectionState::Disconnected, ConnectionReason::Shutdown);
}

uint32_t ConnectionManager::send(const protocol::CommandFrame & frame)
{
  if (!session_active_ || state_.load() != ConnectionState::Connected) {
    throw NotConnectedError();
  }

  const std::vector<uint8_t> bytes = protocol::encodeCommand(frame);
  int written;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    written = transport_->write(bytes.data(), bytes.size());
  }

  if (written != static_cast<int>(bytes.size())) {
    RCLCPP_WARN(
      logger(), "Write of %s failed (%d of %zu bytes)",
      protocol::commandName(frame.command), written, bytes.size());
    // No more writes on this session; handlers run after the caller unwinds
    state_ = ConnectionState::Disconnected;
    const uint64_t gen = generation_;
    scheduleGuarded(
      scheduling::Duration::zero(),
      [this, gen]() {handleLinkLost(gen, ConnectionReason::ConnectionLost);});
    throw ConnectionLostError("write failed");
  }

  ++sequence_;
  RCLCPP_DEBUG(
    logger(), "Sent %s (%zu data bytes) seq=%u",
    protocol::commandName(frame.command), frame.data.size(), sequence_);
  return sequence_;
}

size_t ConnectionManager::pumpOnce()
{
  if (!session_active_) {
    return 0;
  }
  std::vector<uint8_t> buf(kReadChunk);
  const int n = transport_->read(buf.data(), buf.size());
  if (n > 0) {
    buf.resize(static_cast<size_t>(n));
    onBytes(generation_, buf);
    return static_cast<size_t>(n);
  }
  if (n < 0) {
    handleLinkLost(generation_, ConnectionReason::ConnectionLost);
  }
  return 0;
}

void ConnectionManager::onBytes(uint64_t generation, const std::vector<uint8_t> & bytes)
{
  if (generation != generation_ || !session_active_) {
    return;    // late delivery from a previous session
  }

  decoder_.feed(bytes.data(), bytes.size());
  protocol::ResponseFrame frame;
  while (decoder_.pop(frame)) {
    const auto now = scheduler_.now();
    watchdog_.updateOnValidFrame(now);
    last_activity_ = now;
    if (!frame_handler_) {
      continue;
    }
    try {
      frame_handler_(frame);
    } catch (const std::exception & e) {
      RCLCPP_ERROR(
        logger(), "Frame handler failed on %s: %s",
        protocol::commandName(frame.command), e.what());
    }
    if (generation != generation_ || !session_active_) {
      return;    // the handler tore the session down
    }
  }

  if (decoder_.invalidFrames() != reported_invalid_) {
    RCLCPP_DEBUG(
      logger(), "Discarded %zu invalid frames so far (%zu bytes)",
      decoder_.invalidFrames(), decoder_.discardedBytes());
    reported_invalid_ = decoder_.invalidFrames();
  }
}

void ConnectionManager::handleLinkLost(uint64_t generation, ConnectionReason reason)
{
  if (shutdown_ || generation != generation_ || !session_active_) {
    return;
  }
  session_active_ = false;
  ++generation_;
  cancelTask(tick_task_);
  teardown();
  decoder_.reset();
  state_ = ConnectionState::Disconnected;

  RCLCPP_WARN(
    logger(), "Lost connection to %s: %s",
    options_.host.c_str(), connectionReasonName(reason));
  notify(ConnectionState::Disconnected, reason);
  scheduleReconnect();
}

void ConnectionManager::scheduleReconnect()
{
  if (shutdown_ || reconnect_task_ != scheduling::kInvalidTask) {
    return;
  }
  last_backoff_delay_ = backoff_.next();
  RCLCPP_INFO(
    logger(), "Reconnecting in %lld ms",
    static_cast<long long>(last_backoff_delay_.count()));
  reconnect_task_ = scheduleGuarded(
    last_backoff_delay_, [this]() {
      reconnect_task_ = scheduling::kInvalidTask;
      connect();
    });
}

void ConnectionManager::scheduleTick()
{
  using std::chrono::milliseconds;
  milliseconds interval{0};
  if (options_.heartbeat_interval.count() > 0) {
    interval = options_.heartbeat_interval;
  }
  if (options_.idle_timeout.count() > 0) {
    // Check the idle window a few times per period
    const milliseconds check = std::max(milliseconds(10), options_.idle_timeout / 4);
    interval = interval.count() > 0 ? std::min(interval, check) : check;
  }
  if (interval.count() == 0) {
    return;
  }
  tick_task_ = scheduleGuarded(
    interval, [this]() {
      tick_task_ = scheduling::kInvalidTask;
      onTick();
    });
}

void ConnectionManager::onTick()
{
  if (!session_active_) {
    return;
  }
  const auto now = scheduler_.now();

  if (options_.idle_timeout.count() > 0 && watchdog_.tripped(now)) {
    RCLCPP_WARN(
      logger(), "No frame from receiver for %lld ms",
      static_cast<long long>(options_.idle_timeout.count()));
    handleLinkLost(generation_, ConnectionReason::IdleTimeout);
    return;
  }

  if (options_.heartbeat_interval.count() > 0 &&
    now - last_heartbeat_ >= options_.heartbeat_interval)
  {
    last_heartbeat_ = now;
    try {
      send(protocol::makeCommand(protocol::CommandId::HEARTBEAT));
    } catch (const JblavError & e) {
      RCLCPP_DEBUG(logger(), "Heartbeat not sent: %s", e.what());
      return;
    }
  }
  scheduleTick();
}

void ConnectionManager::teardown()
{
  stopReader();
  transport_->close();
}

void ConnectionManager::startReader(uint64_t generation)
{
  reader_stop_ = false;
  reader_ = std::thread(&ConnectionManager::readerLoop, this, generation);
}

void ConnectionManager::stopReader()
{
  reader_stop_ = true;
  if (reader_.joinable()) {
    reader_.join();
  }
  reader_stop_ = false;
}

void ConnectionManager::readerLoop(uint64_t generation)
{
  std::vector<uint8_t> buf(kReadChunk);
  while (!reader_stop_.load()) {
    const int n = transport_->read(buf.data(), buf.size());
    if (n > 0) {
      std::vector<uint8_t> bytes(buf.begin(), buf.begin() + n);
      scheduleGuarded(
        scheduling::Duration::zero(),
        [this, generation, bytes = std::move(bytes)]() {onBytes(generation, bytes);});
    } else if (n < 0) {
      if (!reader_stop_.load()) {
        scheduleGuarded(
          scheduling::Duration::zero(),
          [this, generation]() {handleLinkLost(generation, ConnectionReason::ConnectionLost);});
      }
      return;
    }
  }
}

} // namespace connection
} // namespace jblav
