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

#include "jblav_utils/safety/limited_control_detector.hpp"

namespace jblav
{
namespace safety
{

LimitedControlDetector::LimitedControlDetector(LimitedControlThresholds thresholds)
: thresholds_(thresholds)
{
}

bool LimitedControlDetector::raise()
{
  if (limited_) {
    return false;
  }
  limited_ = true;
  return true;
}

bool LimitedControlDetector::onCommandTimeout()
{
  ++command_timeouts_;
  if (thresholds_.command_timeouts > 0 && command_timeouts_ >= thresholds_.command_timeouts) {
    return raise();
  }
  return false;
}

bool LimitedControlDetector::onConnectRefused()
{
  if (!known_reachable_) {
    return false;
  }
  ++refused_connects_;
  if (thresholds_.refused_connects > 0 && refused_connects_ >= thresholds_.refused_connects) {
    return raise();
  }
  return false;
}

bool LimitedControlDetector::onSessionEstablished()
{
  known_reachable_ = true;
  refused_connects_ = 0;
  return false;
}

bool LimitedControlDetector::onFrameReceived()
{
  command_timeouts_ = 0;
  refused_connects_ = 0;
  if (!limited_) {
    return false;
  }
  limited_ = false;
  return true;
}

void LimitedControlDetector::reset()
{
  command_timeouts_ = 0;
  refused_connects_ = 0;
  known_reachable_ = false;
  limited_ = false;
}

} // namespace safety
} // namespace jblav
