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

#ifndef JBLAV_UTILS__DISPATCH__COMMAND_DISPATCHER_HPP_
#define JBLAV_UTILS__DISPATCH__COMMAND_DISPATCHER_HPP_

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "jblav_utils/connection/connection_manager.hpp"
#include "jblav_utils/dispatch/intent.hpp"
#include "jblav_utils/scheduling/scheduler.hpp"
#include "jblav_utils/state/state_synchronizer.hpp"

namespace jblav
{
namespace dispatch
{

struct DispatcherOptions
{
  std::chrono::milliseconds command_timeout{3000};
  int max_retries = 2;
  std::chrono::milliseconds coalesce_window{50};
  // Complete an intent at once when the device already has the value
  bool suppress_redundant = true;
};

/**
 * @brief Turns intents into command frames and tracks them to completion
 *
 * Each axis owns at most one pending command. An intent waits out the
 * coalesce window before it is written, so a burst on one axis reaches the
 * socket as one frame carrying the last value. A newer intent on an axis
 * supersedes the pending one whether it was written yet or not.
 *
 * Written commands apply their value optimistically and wait for a status
 * frame with the same command ID. Without one they are rewritten with the
 * same payload up to max_retries times, then reverted and reported Timeout.
 *
 * issue() may be called from any thread; everything else runs on the
 * scheduler.
 */
class CommandDispatcher
{
public:
  using TimeoutObserver = std::function<void (state::Axis)>;
  using SentObserver = std::function<void (uint32_t seq, scheduling::TimePoint)>;
  using AckObserver = std::function<void (uint32_t seq, scheduling::TimePoint)>;
  using AbandonObserver = std::function<void (uint32_t seq)>;

  CommandDispatcher(
    scheduling::Scheduler & scheduler,
    connection::ConnectionManager & connection,
    state::StateSynchronizer & synchronizer,
    DispatcherOptions options = {});
  ~CommandDispatcher();

  CommandDispatcher(const CommandDispatcher &) = delete;
  CommandDispatcher & operator=(const CommandDispatcher &) = delete;

  /**
   * @brief Request a value on one axis
   *
   * The value is validated and encoded before this returns; the rest of the
   * work is posted to the scheduler and handler is called there exactly once.
   *
   * @throws EncodingError if the value is out of range for the axis
   */
  void issue(state::Axis axis, int value, CompletionHandler handler = nullptr);

  // issue() for callers already on the scheduler; the intent is queued before this returns
  void issueNow(state::Axis axis, int value, CompletionHandler handler = nullptr);

  /**
   * @brief Route an inbound frame to its pending command
   *
   * A status value that echoes a superseded, already written command only
   * updates state; the newer command on the axis keeps waiting.
   *
   * @return true if the frame was consumed here and already applied to state
   */
  bool onFrame(const protocol::ResponseFrame & frame);

  // Complete every pending command with outcome
  void failAll(CommandOutcome outcome);

  void setTimeoutObserver(TimeoutObserver observer) {timeout_observer_ = std::move(observer);}
  void setLatencyObservers(SentObserver sent, AckObserver acked, AbandonObserver abandoned);

  size_t pendingCount() const {return pending_.size();}
  bool hasPending(state::Axis axis) const {return pending_.count(axis) != 0;}
  bool inFlight(state::Axis axis) const;
  // Value of the newest intent on axis, sent or not
  std::optional<int> pendingValue(state::Axis axis) const;
  const DispatcherOptions & options() const {return options_;}

private:
  struct PendingCommand
  {
    Intent intent;
    protocol::CommandFrame frame;
    CompletionHandler handler;
    scheduling::TimePoint issued_at;
    int retries = 0;
    uint32_t seq = 0;
    bool in_flight = false;
    scheduling::TaskId timer = scheduling::kInvalidTask;
    // Values of superseded commands already written on this axis whose echo may still arrive
    std::vector<int> stale_values;
  };

  // Drops one stale entry matching frame; true if the frame echoes a superseded command
  bool consumeStaleEcho(PendingCommand & pending, const protocol::ResponseFrame & frame);

  void submit(Intent intent, protocol::CommandFrame frame, CompletionHandler handler);
  void flush(state::Axis axis);
  void onTimeout(state::Axis axis, uint32_t seq);
  void armTimeout(PendingCommand & pending);
  // Removes the axis entry and reports outcome to its handler
  void finish(state::Axis axis, CommandOutcome outcome);
  void complete(CompletionHandler & handler, const Intent & intent, CommandOutcome outcome);
  bool writeFrame(PendingCommand & pending);

  scheduling::Scheduler & scheduler_;
  connection::ConnectionManager & connection_;
  state::StateSynchronizer & sync_;
  DispatcherOptions options_;

  std::map<state::Axis, PendingCommand> pending_;

  TimeoutObserver timeout_observer_;
  SentObserver sent_observer_;
  AckObserver ack_observer_;
  AbandonObserver abandon_observer_;

  std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

} // namespace dispatch
} // namespace jblav

#endif  // JBLAV_UTILS__DISPATCH__COMMAND_DISPATCHER_HPP_
