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

#ifndef JBLAV_UTILS__DISPATCH__INTENT_HPP_
#define JBLAV_UTILS__DISPATCH__INTENT_HPP_

#pragma once

#include <functional>

#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/state/axis.hpp"

namespace jblav
{
namespace dispatch
{

enum class CommandOutcome
{
  Acknowledged,
  Superseded,       // replaced by a newer intent on the same axis
  Timeout,          // retries exhausted without an answer
  NotConnected,
  LimitedControl,   // receiver is in green standby
  Rejected,         // receiver answered with an error code
  Cancelled         // shutdown
};

const char * outcomeName(CommandOutcome outcome);

using CompletionHandler = std::function<void (CommandOutcome)>;

// Desired value for one axis, in the units of ReceiverState (dB for EQ)
struct Intent
{
  state::Axis axis;
  int value;
};

// Throws EncodingError when the value is outside the axis range
protocol::CommandFrame encodeIntent(const Intent & intent);

} // namespace dispatch
} // namespace jblav

#endif  // JBLAV_UTILS__DISPATCH__INTENT_HPP_
