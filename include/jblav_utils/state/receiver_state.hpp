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

#ifndef JBLAV_UTILS__STATE__RECEIVER_STATE_HPP_
#define JBLAV_UTILS__STATE__RECEIVER_STATE_HPP_

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "jblav_utils/protocol/constants.hpp"
#include "jblav_utils/state/axis.hpp"

namespace jblav
{
namespace state
{

// Last known receiver state. Unset optionals mean "unknown".
struct ReceiverState
{
  bool connected = false;
  bool limited_control = false;

  std::optional<PowerState> power;
  std::optional<int> volume;              // 0..99
  std::optional<bool> mute;
  std::optional<protocol::InputSource> input;
  std::optional<protocol::SurroundMode> surround_mode;
  std::optional<int> display_dim;         // 0..3
  std::optional<bool> party_mode;
  std::optional<int> party_volume;        // 0..99
  std::optional<int> treble_db;           // -6..6
  std::optional<int> bass_db;             // -6..6
  std::optional<bool> room_eq;
  std::optional<bool> dialog_enhance;
  std::optional<bool> dolby_audio_mode;
  std::optional<bool> drc;
  std::optional<int> streaming_state;
  std::optional<protocol::Model> model;
  std::optional<std::string> version;     // IP control version, "1.7"

  bool operator==(const ReceiverState & other) const;
  bool operator!=(const ReceiverState & other) const {return !(*this == other);}
};

enum class Field
{
  Connected,
  LimitedControl,
  Power,
  Volume,
  Mute,
  Input,
  SurroundMode,
  DisplayDim,
  PartyMode,
  PartyVolume,
  TrebleEq,
  BassEq,
  RoomEq,
  DialogEnhance,
  DolbyAudioMode,
  Drc,
  StreamingState,
  Model,
  Version
};

const char * fieldName(Field field);
Field axisField(Axis axis);

std::optional<int> axisValue(const ReceiverState & state, Axis axis);
void setAxisValue(ReceiverState & state, Axis axis, std::optional<int> value);

struct FieldChange
{
  Field field;
  std::optional<int> value;   // integer form; unset for unknown and for Version
  std::string text;           // display form, "unknown" when unset
};

// Fields whose value differs between two states, in Field order
std::vector<FieldChange> diffStates(const ReceiverState & before, const ReceiverState & after);
std::vector<FieldChange> describeState(const ReceiverState & state);

} // namespace state
} // namespace jblav

#endif  // JBLAV_UTILS__STATE__RECEIVER_STATE_HPP_
