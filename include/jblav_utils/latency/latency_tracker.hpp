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

#ifndef JBLAV_UTILS__LATENCY__LATENCY_TRACKER_HPP_
#define JBLAV_UTILS__LATENCY__LATENCY_TRACKER_HPP_

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace jblav
{
namespace latency
{

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

/**
 * @brief Tracks command round-trip latency by connection sequence number
 *
 * A sample is the time between writing a command frame and the status frame
 * that acknowledged it. Statistics cover a sliding window of the most recent
 * samples.
 */
class LatencyTracker
{
public:
  /**
   * @param window_size Maximum number of samples kept in the sliding window
   */
  explicit LatencyTracker(size_t window_size = 100);

  void recordCommandSent(uint32_t seq, TimePoint send_time);

  /**
   * @brief Close the measurement opened for seq
   *
   * Unknown or expired sequence numbers are ignored.
   */
  void recordAcknowledged(uint32_t seq, TimePoint receive_time);

  // Forget a command that will never be acknowledged (superseded, timed out)
  void discard(uint32_t seq);

  Duration getP95Latency() const;
  Duration getMeanLatency() const;
  Duration getMaxLatency() const;
  size_t getSampleCount() const;
  size_t getPendingCount() const {return pending_commands_.size();}

  void reset();

private:
  struct PendingCommand
  {
    uint32_t seq;
    TimePoint send_time;
  };

  size_t window_size_;
  std::vector<PendingCommand> pending_commands_;
  std::vector<Duration> latencies_;

  void cleanupOldPending(TimePoint current_time);

  // Longer than timeout x (retries + 1) with the default timing
  static constexpr auto MAX_PENDING_TIME = std::chrono::milliseconds(10000);
};

} // namespace latency
} // namespace jblav

#endif  // JBLAV_UTILS__LATENCY__LATENCY_TRACKER_HPP_
