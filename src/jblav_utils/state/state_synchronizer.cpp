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

#include "jblav_utils/state/state_synchronizer.hpp"

#include <rclcpp/rclcpp.hpp>

namespace jblav
{
namespace state
{

using protocol::CommandId;

static const rclcpp::Logger & logger()
{
  static const rclcpp::Logger l = rclcpp::get_logger("JblAvStateSync");
  return l;
}

StateSynchronizer::SubscriptionId StateSynchronizer::subscribe(Listener listener)
{
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void StateSynchronizer::unsubscribe(SubscriptionId id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

ReceiverState StateSynchronizer::visibleLocked() const
{
  ReceiverState visible = confirmed_;
  for (const auto & entry : overlay_) {
    setAxisValue(visible, entry.first, entry.second);
  }
  return visible;
}

ReceiverState StateSynchronizer::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return visibleLocked();
}

ReceiverState StateSynchronizer::confirmed() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return confirmed_;
}

std::optional<int> StateSynchronizer::confirmedValue(Axis axis) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return axisValue(confirmed_, axis);
}

bool StateSynchronizer::hasOptimistic(Axis axis) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return overlay_.count(axis) != 0;
}

bool StateSynchronizer::applyFrame(const protocol::ResponseFrame & frame, bool keep_optimistic)
{
  if (!frame.isStatus()) {
    // Error codes answer a bad command; they say nothing about device state
    RCLCPP_WARN(
      logger(), "Receiver rejected %s: %s",
      protocol::commandName(frame.command), protocol::responseCodeName(frame.code));
    return false;
  }

  ReceiverState before;
  ReceiverState after;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    before = visibleLocked();
    const ReceiverState previous = confirmed_;

    if (auto axis = axisForCommand(frame.command)) {
      if (frame.data.size() != 1) {
        RCLCPP_WARN(
          logger(), "Ignoring %s status with %zu data bytes",
          protocol::commandName(frame.command), frame.data.size());
        return false;
      }
      auto value = decodeAxisValue(*axis, frame.data[0]);
      if (!value) {
        RCLCPP_WARN(
          logger(), "Ignoring %s status with out-of-range value 0x%02X",
          protocol::commandName(frame.command), frame.data[0]);
        return false;
      }
      setAxisValue(confirmed_, *axis, value);
      if (!keep_optimistic) {
        overlay_.erase(*axis);
      }
      // A power report from the device supersedes an inferred green standby
      if (*axis == Axis::Power) {
        confirmed_.limited_control = false;
      }
    } else {
      switch (frame.command) {
        case CommandId::STREAMING_STATE:
          if (!frame.data.empty()) {
            confirmed_.streaming_state = frame.data[0];
          }
          break;
        case CommandId::INITIALIZATION:
          if (!frame.data.empty() &&
            frame.data[0] >= static_cast<uint8_t>(protocol::Model::MA510) &&
            frame.data[0] <= static_cast<uint8_t>(protocol::Model::MA9100HP))
          {
            confirmed_.model = static_cast<protocol::Model>(frame.data[0]);
          } else {
            RCLCPP_WARN(logger(), "Unknown model in initialization response");
          }
          break;
        case CommandId::VERSION:
        {
          std::string version;
          for (size_t i = 0; i < frame.data.size(); ++i) {
            if (i > 0) {version += '.';}
            version += std::to_string(frame.data[i]);
          }
          confirmed_.version = version;
          break;
        }
        case CommandId::HEARTBEAT:
        case CommandId::SIMULATE_IR:
        case CommandId::REBOOT:
        case CommandId::FACTORY_RESET:
          RCLCPP_DEBUG(logger(), "%s acknowledged", protocol::commandName(frame.command));
          break;
        default:
          RCLCPP_WARN(
            logger(), "Ignoring status for unknown command 0x%02X",
            static_cast<unsigned>(frame.command));
          return false;
      }
    }

    changed = confirmed_ != previous;
    after = visibleLocked();
  }

  publishDelta(before, after);
  return changed;
}

bool StateSynchronizer::reconcile(Axis axis, const protocol::ResponseFrame & frame)
{
  if (frame.command != axisCommand(axis)) {
    return false;
  }
  applyFrame(frame);
  return true;
}

void StateSynchronizer::applyOptimistic(Axis axis, int value)
{
  ReceiverState before;
  ReceiverState after;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    before = visibleLocked();
    overlay_[axis] = value;
    after = visibleLocked();
  }
  publishDelta(before, after);
}

void StateSynchronizer::revertOptimistic(Axis axis)
{
  ReceiverState before;
  ReceiverState after;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (overlay_.count(axis) == 0) {
      return;
    }
    before = visibleLocked();
    overlay_.erase(axis);
    after = visibleLocked();
  }
  publishDelta(before, after);
}

void StateSynchronizer::markUnknown()
{
  ReceiverState state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool limited = confirmed_.limited_control;
    confirmed_ = ReceiverState{};
    confirmed_.limited_control = limited;
    if (limited) {
      confirmed_.power = PowerState::GreenStandby;
    }
    overlay_.clear();
    state = confirmed_;
  }
  publishSnapshot(state);
}

void StateSynchronizer::onConnected()
{
  ReceiverState state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    confirmed_.connected = true;
    state = visibleLocked();
  }
  publishSnapshot(state);
}

void StateSynchronizer::setLimitedControl(bool limited)
{
  ReceiverState before;
  ReceiverState after;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (confirmed_.limited_control == limited) {
      return;
    }
    before = visibleLocked();
    confirmed_.limited_control = limited;
    if (limited) {
      confirmed_.power = PowerState::GreenStandby;
      overlay_.erase(Axis::Power);
    } else if (confirmed_.power == PowerState::GreenStandby) {
      confirmed_.power.reset();
    }
    after = visibleLocked();
  }
  RCLCPP_INFO(logger(), "Limited control %s", limited ? "raised" : "cleared");
  publishDelta(before, after);
}

void StateSynchronizer::publishDelta(const ReceiverState & before, const ReceiverState & after)
{
  StateEvent event;
  event.kind = StateEvent::Kind::Delta;
  event.changes = diffStates(before, after);
  if (event.changes.empty()) {
    return;
  }
  event.state = after;
  dispatch(event);
}

void StateSynchronizer::publishSnapshot(const ReceiverState & state)
{
  StateEvent event;
  event.kind = StateEvent::Kind::Snapshot;
  event.changes = describeState(state);
  event.state = state;
  dispatch(event);
}

void StateSynchronizer::dispatch(const StateEvent & event)
{
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners.reserve(listeners_.size());
    for (const auto & entry : listeners_) {
      listeners.push_back(entry.second);
    }
  }
  for (const auto & listener : listeners) {
    listener(event);
  }
}

} // namespace state
} // namespace jblav
