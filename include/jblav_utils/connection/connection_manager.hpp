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

#ifndef JBLAV_UTILS__CONNECTION__CONNECTION_MANAGER_HPP_
#define JBLAV_UTILS__CONNECTION__CONNECTION_MANAGER_HPP_

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "jblav_utils/connection/backoff.hpp"
#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/safety/watchdog.hpp"
#include "jblav_utils/scheduling/scheduler.hpp"
#include "jblav_utils/transport/transport.hpp"

namespace jblav
{
namespace connection
{

enum class ConnectionState
{
  Disconnected,
  Connecting,
  Connected
};

enum class ConnectionReason
{
  Connected,
  ConnectFailed,
  ConnectionLost,
  IdleTimeout,
  Shutdown
};

const char * connectionStateName(ConnectionState state);
const char * connectionReasonName(ConnectionReason reason);

struct ConnectionOptions
{
  std::string host;
  uint16_t port = protocol::CONTROL_PORT;
  std::chrono::milliseconds connect_timeout{5000};
  int read_timeout_ms = 100;
  int write_timeout_ms = 1000;
  // 0 disables the heartbeat or the idle check
  std::chrono::milliseconds heartbeat_interval{10000};
  std::chrono::milliseconds idle_timeout{30000};
  BackoffPolicy backoff;
  std::optional<uint32_t> backoff_seed;
  // Tests turn this off and drive reads with pumpOnce()
  bool spawn_reader_thread = true;
};

/**
 * @brief Owns the TCP session with the receiver
 *
 * Disconnected -> Connecting -> Connected -> Disconnected, cycling back to
 * Connecting on its own after a failed attempt or a lost link until
 * shutdown() is called. A reader thread pulls bytes from the transport and
 * hands them to the scheduler; decoding, liveness tracking and every handler
 * call happen on the scheduler, in wire order.
 *
 * Apart from state(), all methods must be called from the scheduler context.
 * The scheduler must be stopped or drained before the manager is destroyed.
 */
class ConnectionManager
{
public:
  using FrameHandler = std::function<void (const protocol::ResponseFrame &)>;
  using StateHandler = std::function<void (ConnectionState, ConnectionReason)>;
  using AttemptHandler = std::function<void (transport::OpenResult)>;

  ConnectionManager(
    scheduling::Scheduler & scheduler,
    std::unique_ptr<transport::Transport> transport,
    ConnectionOptions options);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager & operator=(const ConnectionManager &) = delete;

  void setFrameHandler(FrameHandler handler) {frame_handler_ = std::move(handler);}
  void setStateHandler(StateHandler handler) {state_handler_ = std::move(handler);}
  // Called with the outcome of every connect attempt
  void setAttemptHandler(AttemptHandler handler) {attempt_handler_ = std::move(handler);}

  // Posts the first connect attempt
  void start();
  // Terminal: closes the socket, cancels timers, no further reconnects
  void shutdown();

  // One connect attempt, now. Closes any stale session first.
  void connect();

  /**
   * @brief Write one command frame
   *
   * @return The connection sequence number assigned to the write
   * @throws NotConnectedError when not Connected
   * @throws ConnectionLostError when the write fails; reconnect is scheduled
   */
  uint32_t send(const protocol::CommandFrame & frame);

  // Reads once from the transport and processes the result inline.
  // Returns the number of bytes read.
  size_t pumpOnce();

  ConnectionState state() const {return state_.load();}
  bool isConnected() const {return state_.load() == ConnectionState::Connected;}
  bool isShutdown() const {return shutdown_;}

  scheduling::TimePoint lastActivity() const {return last_activity_;}
  uint32_t sequence() const {return sequence_;}
  int consecutiveFailures() const {return consecutive_failures_;}
  std::chrono::milliseconds lastBackoffDelay() const {return last_backoff_delay_;}
  bool reconnectPending() const {return reconnect_task_ != scheduling::kInvalidTask;}
  size_t invalidFrames() const {return decoder_.invalidFrames();}
  const ConnectionOptions & options() const {return options_;}

private:
  void onBytes(uint64_t generation, const std::vector<uint8_t> & bytes);
  void handleLinkLost(uint64_t generation, ConnectionReason reason);
  void scheduleReconnect();
  void scheduleTick();
  void onTick();
  void teardown();
  void startReader(uint64_t generation);
  void stopReader();
  void readerLoop(uint64_t generation);
  void notify(ConnectionState state, ConnectionReason reason);

  // Schedules fn unless the manager has been destroyed by the time it runs
  scheduling::TaskId scheduleGuarded(scheduling::Duration delay, std::function<void ()> fn);
  void cancelTask(scheduling::TaskId & id);

  scheduling::Scheduler & scheduler_;
  std::unique_ptr<transport::Transport> transport_;
  ConnectionOptions options_;

  FrameHandler frame_handler_;
  StateHandler state_handler_;
  AttemptHandler attempt_handler_;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  bool shutdown_ = false;
  bool session_active_ = false;
  uint64_t generation_ = 0;
  uint32_t sequence_ = 0;
  int consecutive_failures_ = 0;

  Backoff backoff_;
  std::chrono::milliseconds last_backoff_delay_{0};
  safety::Watchdog watchdog_;
  protocol::FrameDecoder decoder_;
  size_t reported_invalid_ = 0;
  scheduling::TimePoint last_activity_{};
  scheduling::TimePoint last_heartbeat_{};

  scheduling::TaskId reconnect_task_ = scheduling::kInvalidTask;
  scheduling::TaskId tick_task_ = scheduling::kInvalidTask;

  std::mutex write_mutex_;
  std::thread reader_;
  std::atomic<bool> reader_stop_{false};

  std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

} // namespace connection
} // namespace jblav

#endif  // JBLAV_UTILS__CONNECTION__CONNECTION_MANAGER_HPP_
