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

#ifndef JBLAV_UTILS__STATE__STATE_SYNCHRONIZER_HPP_
#define JBLAV_UTILS__STATE__STATE_SYNCHRONIZER_HPP_

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/state/receiver_state.hpp"

namespace jblav
{
namespace state
{

struct StateEvent
{
  enum class Kind
  {
    Delta,      // changes lists only the fields that changed
    Snapshot    // changes lists every field
  };

  Kind kind = Kind::Delta;
  std::vector<FieldChange> changes;
  ReceiverState state;
};

/**
 * @brief Canonical receiver state and its change feed
 *
 * Holds the confirmed state, as last reported by the device, plus an
 * optimistic overlay of values sent but not yet confirmed. Readers see the
 * overlay applied. A status frame on an axis always replaces the overlay
 * for that axis.
 *
 * Mutators run on the scheduler; snapshot(), subscribe() and unsubscribe()
 * may be called from any thread. Listeners are invoked on the mutating
 * thread without the internal lock held.
 */
class StateSynchronizer
{
public:
  using Listener = std::function<void (const StateEvent &)>;
  using SubscriptionId = uint64_t;

  StateSynchronizer() = default;

  SubscriptionId subscribe(Listener listener);
  void unsubscribe(SubscriptionId id);

  ReceiverState snapshot() const;
  ReceiverState confirmed() const;
  std::optional<int> confirmedValue(Axis axis) const;
  bool hasOptimistic(Axis axis) const;

  // Returns true if the frame changed confirmed state. keep_optimistic leaves a
  // pending value on the frame's axis visible.
  bool applyFrame(const protocol::ResponseFrame & frame, bool keep_optimistic = false);

  /**
   * @brief Apply a frame that answers a pending command on axis
   *
   * @return false if the frame belongs to another axis; nothing is applied then
   */
  bool reconcile(Axis axis, const protocol::ResponseFrame & frame);

  void applyOptimistic(Axis axis, int value);
  void revertOptimistic(Axis axis);

  // Link gone: every device field unknown, one Snapshot event
  void markUnknown();
  // Session up: connected flag set, one Snapshot event
  void onConnected();
  // Green standby inferred or cleared
  void setLimitedControl(bool limited);

private:
  ReceiverState visibleLocked() const;
  // Emits a Delta event if the visible state changed
  void publishDelta(const ReceiverState & before, const ReceiverState & after);
  void publishSnapshot(const ReceiverState & state);
  void dispatch(const StateEvent & event);

  mutable std::mutex mutex_;
  ReceiverState confirmed_;
  std::map<Axis, int> overlay_;
  std::map<SubscriptionId, Listener> listeners_;
  SubscriptionId next_id_ = 1;
};

} // namespace state
} // namespace jblav

#endif  // JBLAV_UTILS__STATE__STATE_SYNCHRONIZER_HPP_
