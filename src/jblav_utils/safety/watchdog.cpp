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

#include "jblav_utils/safety/watchdog.hpp"

namespace jblav
{
namespace safety
{

Watchdog::Watchdog(std::chrono::milliseconds timeout)
: timeout_(timeout),
  last_valid_frame_time_(std::chrono::steady_clock::now())
{
}

void Watchdog::updateOnValidFrame(TimePoint now)
{
  last_valid_frame_time_ = now;
  tripped_ = false;
}

bool Watchdog::tripped(TimePoint now)
{
  // Latches until the next valid frame or reset
  if (!tripped_ && now - last_valid_frame_time_ > timeout_) {
    tripped_ = true;
  }
  return tripped_;
}

void Watchdog::reset(TimePoint now)
{
  last_valid_frame_time_ = now;
  tripped_ = false;
}

} // namespace safety
} // namespace jblav
