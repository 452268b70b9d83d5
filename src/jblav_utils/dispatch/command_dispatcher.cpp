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

#include "jblav_utils/dispatch/command_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <rclcpp/rclcpp.hpp>

#include "jblav_utils/errors.hpp"
#include "jblav_utils/state/axis.hpp"

namespace jblav
{
namespace dispatch
{

using state::Axis;

static const rclcpp::Logger & logger()
{
  static const rclcpp::Logger l = rclcpp::get_logger("JblAvDispatcher");
  return l;
}

CommandDispatcher::CommandDispatcher(
  scheduling::Scheduler & scheduler,
  connection::ConnectionManager & connection,
  state::StateSynchronizer & synchronizer,
  DispatcherOptions options)
: scheduler_(scheduler),
  connection_(connection),
  sync_(synchronizer),
  options_(options)
{
  if (options_.max_retries < 0) {
    options_.max_retries = 0;
  }
}

CommandDispatcher::~CommandDispatcher()
{
  for (auto & entry : pending_) {
    if (entry.second.timer != scheduling::kInvalidTask) {
      scheduler_.cancel(entry.second.timer);
    }
  }
}

void CommandDispatcher::setLatencyObservers(
  SentObserver sent, AckObserver acked,
  AbandonObserver abandoned)
{
  sent_observer_ = std::move(sent);
  ack_observer_ = std::move(acked);
  abandon_observer_ = std::move(abandoned);
}

bool CommandDispatcher::inFlight(Axis axis) const
{
  auto it = pending_.find(axis);
  return it != pending_.end() && it->second.in_flight;
}

std::optional<int> CommandDispatcher::pendingValue(Axis axis) const
{
  auto it = pending_.find(axis);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second.intent.value;
}

void CommandDispatcher::issueNow(Axis axis, int value, CompletionHandler handler)
{
  Intent intent{axis, value};
  submit(intent, encodeIntent(intent), std::move(handler));
}

void CommandDispatcher::issue(Axis axis, int value, CompletionHandler handler)
{
  Intent intent{axis, value};
  protocol::CommandFrame frame = encodeIntent(intent);
  scheduling::scheduleGuarded(
    scheduler_, alive_, scheduling::Duration::zero(),
    [this, intent, frame = std::move(frame), handler = std::move(handler)]() mutable {
      submit(intent, std::move(frame), std::move(handler));
    });
}

void CommandDispatcher::complete(
  CompletionHandler & handler, const Intent & intent,
  CommandOutcome outcome)
{
  RCLCPP_DEBUG(
    logger(), "%s=%d %s", state::axisName(intent.axis), intent.value, outcomeName(outcome));
  if (!handler) {
    return;
  }
  try {
    handler(outcome);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(
      logger(), "Completion handler for %s threw: %s", state::axisName(intent.axis), e.what());
  }
}

void CommandDispatcher::submit(
  Intent intent, protocol::CommandFrame frame,
  CompletionHandler handler)
{
  const Axis axis = intent.axis;

  if (!connection_.isConnected()) {
    complete(handler, intent, CommandOutcome::NotConnected);
    return;
  }
  if (axis != Axis::Power && sync_.confirmed().limited_control) {
    complete(handler, intent, CommandOutcome::LimitedControl);
    return;
  }

  std::vector<int> stale;
  auto existing = pending_.find(axis);
  if (existing != pending_.end()) {
    RCLCPP_DEBUG(
      logger(), "%s=%d supersedes %d", state::axisName(axis), intent.value,
      existing->second.intent.value);
    if (existing->second.timer != scheduling::kInvalidTask) {
      scheduler_.cancel(existing->second.timer);
    }
    if (existing->second.in_flight && abandon_observer_) {
      abandon_observer_(existing->second.seq);
    }
    PendingCommand old = std::move(existing->second);
    pending_.erase(existing);
    stale = std::move(old.stale_values);
    if (old.in_flight) {
      // One possible echo per transmission
      stale.insert(stale.end(), static_cast<size_t>(old.retries + 1), old.intent.value);
    }
    complete(old.handler, old.intent, CommandOutcome::Superseded);
    // The old handler issued again on this axis through issueNow()
    if (pending_.count(axis) != 0) {
      complete(handler, intent, CommandOutcome::Superseded);
      return;
    }
  } else if (options_.suppress_redundant && !sync_.hasOptimistic(axis) &&
    sync_.confirmedValue(axis) == intent.value)
  {
    complete(handler, intent, CommandOutcome::Acknowledged);
    return;
  }

  PendingCommand pending;
  pending.intent = intent;
  pending.frame = std::move(frame);
  pending.handler = std::move(handler);
  pending.issued_at = scheduler_.now();
  pending.stale_values = std::move(stale);
  pending.timer = scheduling::scheduleGuarded(
    scheduler_, alive_, options_.coalesce_window,
    [this, axis]() {flush(axis);});
  pending_[axis] = std::move(pending);
}

bool CommandDispatcher::writeFrame(PendingCommand & pending)
{
  try {
    pending.seq = connection_.send(pending.frame);
  } catch (const JblavError & e) {
    RCLCPP_WARN(
      logger(), "Could not send %s: %s", state::axisName(pending.intent.axis), e.what());
    return false;
  }
  if (sent_observer_) {
    sent_observer_(pending.seq, scheduler_.now());
  }
  return true;
}

void CommandDispatcher::armTimeout(PendingCommand & pending)
{
  const Axis axis = pending.intent.axis;
  const uint32_t seq = pending.seq;
  pending.timer = scheduling::scheduleGuarded(
    scheduler_, alive_, options_.command_timeout,
    [this, axis, seq]() {onTimeout(axis, seq);});
}

void CommandDispatcher::flush(Axis axis)
{
  auto it = pending_.find(axis);
  if (it == pending_.end()) {
    return;
  }
  PendingCommand & pending = it->second;
  pending.timer = scheduling::kInvalidTask;

  if (!connection_.isConnected()) {
    finish(axis, CommandOutcome::NotConnected);
    return;
  }
  if (axis != Axis::Power && sync_.confirmed().limited_control) {
    finish(axis, CommandOutcome::LimitedControl);
    return;
  }
  if (!writeFrame(pending)) {
    finish(axis, CommandOutcome::NotConnected);
    return;
  }

  pending.in_flight = true;
  sync_.applyOptimistic(axis, pending.intent.value);
  armTimeout(pending);
}

void CommandDispatcher::onTimeout(Axis axis, uint32_t seq)
{
  auto it = pending_.find(axis);
  if (it == pending_.end() || !it->second.in_flight || it->second.seq != seq) {
    return;
  }
  PendingCommand & pending = it->second;
  pending.timer = scheduling::kInvalidTask;
  if (abandon_observer_) {
    abandon_observer_(pending.seq);
  }

  if (pending.retries < options_.max_retries) {
    ++pending.retries;
    RCLCPP_WARN(
      logger(), "No answer to %s=%d, retry %d of %d", state::axisName(axis),
      pending.intent.value, pending.retries, options_.max_retries);
    if (!writeFrame(pending)) {
      finish(axis, CommandOutcome::NotConnected);
      return;
    }
    armTimeout(pending);
    return;
  }

  RCLCPP_WARN(
    logger(), "%s=%d timed out after %d attempts", state::axisName(axis),
    pending.intent.value, pending.retries + 1);
  finish(axis, CommandOutcome::Timeout);
  if (timeout_observer_) {
    timeout_observer_(axis);
  }
}

bool CommandDispatcher::onFrame(const protocol::ResponseFrame & frame)
{
  auto axis = state::axisForCommand(frame.command);
  if (!axis) {
    return false;
  }
  auto it = pending_.find(*axis);
  if (it == pending_.end()) {
    return false;
  }

  PendingCommand & pending = it->second;
  if (consumeStaleEcho(pending, frame)) {
    RCLCPP_DEBUG(
      logger(), "Late answer to a superseded %s command, %d still pending",
      state::axisName(*axis), pending.intent.value);
    sync_.applyFrame(frame, pending.in_flight);
    return true;
  }
  if (!pending.in_flight) {
    return false;
  }

  if (pending.timer != scheduling::kInvalidTask) {
    scheduler_.cancel(pending.timer);
    pending.timer = scheduling::kInvalidTask;
  }

  if (frame.isStatus()) {
    sync_.reconcile(*axis, frame);
    if (ack_observer_) {
      ack_observer_(pending.seq, scheduler_.now());
    }
    finish(*axis, CommandOutcome::Acknowledged);
  } else {
    RCLCPP_WARN(
      logger(), "Receiver rejected %s=%d: %s", state::axisName(*axis),
      pending.intent.value, protocol::responseCodeName(frame.code));
    if (abandon_observer_) {
      abandon_observer_(pending.seq);
    }
    finish(*axis, CommandOutcome::Rejected);
  }
  return true;
}

bool CommandDispatcher::consumeStaleEcho(
  PendingCommand & pending,
  const protocol::ResponseFrame & frame)
{
  if (pending.stale_values.empty() || !frame.isStatus() || frame.data.empty()) {
    return false;
  }
  auto value = state::decodeAxisValue(pending.intent.axis, frame.data[0]);
  if (!value || *value == pending.intent.value) {
    return false;
  }
  auto it = std::find(pending.stale_values.begin(), pending.stale_values.end(), *value);
  if (it == pending.stale_values.end()) {
    return false;
  }
  pending.stale_values.erase(it);
  return true;
}

void CommandDispatcher::finish(Axis axis, CommandOutcome outcome)
{
  auto it = pending_.find(axis);
  if (it == pending_.end()) {
    return;
  }
  PendingCommand pending = std::move(it->second);
  pending_.erase(it);
  if (pending.timer != scheduling::kInvalidTask) {
    scheduler_.cancel(pending.timer);
  }
  if (outcome != CommandOutcome::Acknowledged && outcome != CommandOutcome::Superseded) {
    sync_.revertOptimistic(axis);
  }
  complete(pending.handler, pending.intent, outcome);
}

void CommandDispatcher::failAll(CommandOutcome outcome)
{
  std::map<Axis, PendingCommand> pending;
  pending.swap(pending_);
  for (auto & entry : pending) {
    if (entry.second.timer != scheduling::kInvalidTask) {
      scheduler_.cancel(entry.second.timer);
    }
    if (entry.second.in_flight && abandon_observer_) {
      abandon_observer_(entry.second.seq);
    }
    sync_.revertOptimistic(entry.first);
  }
  for (auto & entry : pending) {
    complete(entry.second.handler, entry.second.intent, outcome);
  }
}

} // namespace dispatch
} // namespace jblav
