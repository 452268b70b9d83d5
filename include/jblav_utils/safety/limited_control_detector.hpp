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

#ifndef JBLAV_UTILS__SAFETY__LIMITED_CONTROL_DETECTOR_HPP_
#define JBLAV_UTILS__SAFETY__LIMITED_CONTROL_DETECTOR_HPP_

#pragma once

namespace jblav
{
namespace safety
{

struct LimitedControlThresholds
{
  int command_timeouts = 2;
  int refused_connects = 3;
};

/**
 * @brief Infers green standby from symptoms on the control channel
 *
 * In green standby the receiver stops answering IP control: an open socket
 * swallows commands, or a host that accepted connections before starts
 * refusing them. Either symptom repeated past its threshold raises the
 * limited-control flag. Any frame from the receiver clears it.
 *
 * Every on*() call returns true when the flag changed.
 */
class LimitedControlDetector
{
public:
  explicit LimitedControlDetector(LimitedControlThresholds thresholds = {});

  bool onCommandTimeout();
  // Refusals only count once the host has accepted a session before
  bool onConnectRefused();
  bool onSessionEstablished();
  bool onFrameReceived();

  bool limited() const {return limited_;}
  int commandTimeouts() const {return command_timeouts_;}
  int refusedConnects() const {return refused_connects_;}
  const LimitedControlThresholds & thresholds() const {return thresholds_;}

  void reset();

private:
  bool raise();

  LimitedControlThresholds thresholds_;
  int command_timeouts_ = 0;
  int refused_connects_ = 0;
  bool known_reachable_ = false;
  bool limited_ = false;
};

} // namespace safety
} // namespace jblav

#endif  // JBLAV_UTILS__SAFETY__LIMITED_CONTROL_DETECTOR_HPP_
