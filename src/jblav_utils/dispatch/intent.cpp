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

#include "jblav_utils/dispatch/intent.hpp"

namespace jblav
{
namespace dispatch
{

const char * outcomeName(CommandOutcome outcome)
{
  switch (outcome) {
    case CommandOutcome::Acknowledged: return "acknowledged";
    case CommandOutcome::Superseded: return "superseded";
    case CommandOutcome::Timeout: return "timeout";
    case CommandOutcome::NotConnected: return "not connected";
    case CommandOutcome::LimitedControl: return "limited control";
    case CommandOutcome::Rejected: return "rejected";
    case CommandOutcome::Cancelled: return "cancelled";
  }
  return "unknown";
}

protocol::CommandFrame encodeIntent(const Intent & intent)
{
  protocol::CommandFrame frame;
  frame.command = state::axisCommand(intent.axis);
  frame.data.push_back(state::encodeAxisValue(intent.axis, intent.value));
  return frame;
}

} // namespace dispatch
} // namespace jblav
