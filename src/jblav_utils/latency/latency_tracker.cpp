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

#include "jblav_utils/latency/latency_tracker.hpp"

#include <algorithm>
#include <numeric>

namespace jblav
{
namespace latency
{

LatencyTracker::LatencyTracker(size_t window_size)
: window_size_(window_size == 0 ? 1 : window_size)
{
  latencies_.reserve(window_size_);
  pending_commands_.reserve(16);
}

void LatencyTracker::recordCommandSent(uint32_t seq, TimePoint send_time)
{
  cleanupOldPending(send_time);
  pending_commands_.push_back({seq, send_time});
}

void LatencyTracker::recordAcknowledged(uint32_t seq, TimePoint receive_time)
{
  cleanupOldPending(receive_time);

  auto it = std::find_if(
    pending_commands_.begin(), pending_commands_.end(),
    [seq](const PendingCommand & cmd) {return cmd.seq == seq;});
  if (it == pending_commands_.end()) {
    return;
  }

  if (latencies_.size() >= window_size_) {
    latencies_.erase(latencies_.begin());
  }
  latencies_.push_back(receive_time - it->send_time);
  pending_commands_.erase(it);
}

void LatencyTracker::discard(uint32_t seq)
{
  pending_commands_.erase(
    std::remove_if(
      pending_commands_.begin(), pending_commands_.end(),
      [seq](const PendingCommand & cmd) {return cmd.seq == seq;}),
    pending_commands_.end());
}

Duration LatencyTracker::getP95Latency() const
{
  if (latencies_.empty()) {
    return Duration::zero();
  }

  std::vector<Duration> sorted_latencies = latencies_;
  std::sort(sorted_latencies.begin(), sorted_latencies.end());

  size_t p95_index = static_cast<size_t>(0.95 * sorted_latencies.size());
  if (p95_index >= sorted_latencies.size()) {
    p95_index = sorted_latencies.size() - 1;
  }
  return sorted_latencies[p95_index];
}

Duration LatencyTracker::getMeanLatency() const
{
  if (latencies_.empty()) {
    return Duration::zero();
  }
  auto total = std::accumulate(latencies_.begin(), latencies_.end(), Duration::zero());
  return total / static_cast<Duration::rep>(latencies_.size());
}

Duration LatencyTracker::getMaxLatency() const
{
  if (latencies_.empty()) {
    return Duration::zero();
  }
  return *std::max_element(latencies_.begin(), latencies_.end());
}

size_t LatencyTracker::getSampleCount() const
{
  return latencies_.size();
}

void LatencyTracker::reset()
{
  latencies_.clear();
  pending_commands_.clear();
}

void LatencyTracker::cleanupOldPending(TimePoint current_time)
{
  pending_commands_.erase(
    std::remove_if(
      pending_commands_.begin(), pending_commands_.end(),
      [current_time](const PendingCommand & cmd)
      {
        return (current_time - cmd.send_time) > MAX_PENDING_TIME;
      }),
    pending_commands_.end());
}

} // namespace latency
} // namespace jblav
