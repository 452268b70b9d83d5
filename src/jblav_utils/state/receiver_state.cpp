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

#include "jblav_utils/state/receiver_state.hpp"

namespace jblav
{
namespace state
{

namespace
{

constexpr Field kAllFields[] = {
  Field::Connected, Field::LimitedControl, Field::Power, Field::Volume, Field::Mute,
  Field::Input, Field::SurroundMode, Field::DisplayDim, Field::PartyMode,
  Field::PartyVolume, Field::TrebleEq, Field::BassEq, Field::RoomEq,
  Field::DialogEnhance, Field::DolbyAudioMode, Field::Drc, Field::StreamingState,
  Field::Model, Field::Version};

std::optional<Axis> fieldAxis(Field field)
{
  for (Axis axis : kAllAxes) {
    if (axisField(axis) == field) {
      return axis;
    }
  }
  return std::nullopt;
}

template<typename T>
std::optional<int> asInt(const std::optional<T> & v)
{
  if (!v) {
    return std::nullopt;
  }
  return static_cast<int>(*v);
}

std::optional<int> fieldValue(const ReceiverState & s, Field field)
{
  if (auto axis = fieldAxis(field)) {
    return axisValue(s, *axis);
  }
  switch (field) {
    case Field::Connected: return s.connected ? 1 : 0;
    case Field::LimitedControl: return s.limited_control ? 1 : 0;
    case Field::StreamingState: return s.streaming_state;
    case Field::Model: return asInt(s.model);
    default: return std::nullopt;
  }
}

std::string fieldText(const ReceiverState & s, Field field)
{
  if (field == Field::Version) {
    return s.version ? *s.version : "unknown";
  }
  auto value = fieldValue(s, field);
  if (!value) {
    return "unknown";
  }
  if (auto axis = fieldAxis(field)) {
    return axisValueText(*axis, *value);
  }
  switch (field) {
    case Field::Connected:
    case Field::LimitedControl:
      return *value ? "yes" : "no";
    case Field::Model:
      return protocol::modelName(static_cast<protocol::Model>(*value));
    default:
      return std::to_string(*value);
  }
}

} // namespace

bool ReceiverState::operator==(const ReceiverState & o) const
{
  return connected == o.connected && limited_control == o.limited_control &&
         power == o.power && volume == o.volume && mute == o.mute && input == o.input &&
         surround_mode == o.surround_mode && display_dim == o.display_dim &&
         party_mode == o.party_mode && party_volume == o.party_volume &&
         treble_db == o.treble_db && bass_db == o.bass_db && room_eq == o.room_eq &&
         dialog_enhance == o.dialog_enhance && dolby_audio_mode == o.dolby_audio_mode &&
         drc == o.drc && streaming_state == o.streaming_state && model == o.model &&
         version == o.version;
}

const char * fieldName(Field field)
{
  switch (field) {
    case Field::Connected: return "connected";
    case Field::LimitedControl: return "limited_control";
    case Field::Power: return "power";
    case Field::Volume: return "volume";
    case Field::Mute: return "mute";
    case Field::Input: return "input";
    case Field::SurroundMode: return "surround_mode";
    case Field::DisplayDim: return "display_dim";
    case Field::PartyMode: return "party_mode";
    case Field::PartyVolume: return "party_volume";
    case Field::TrebleEq: return "treble_eq";
    case Field::BassEq: return "bass_eq";
    case Field::RoomEq: return "room_eq";
    case Field::DialogEnhance: return "dialog_enhance";
    case Field::DolbyAudioMode: return "dolby_audio_mode";
    case Field::Drc: return "drc";
    case Field::StreamingState: return "streaming_state";
    case Field::Model: return "model";
    case Field::Version: return "version";
  }
  return "unknown";
}

Field axisField(Axis axis)
{
  switch (axis) {
    case Axis::Power: return Field::Power;
    case Axis::Volume: return Field::Volume;
    case Axis::Mute: return Field::Mute;
    case Axis::Input: return Field::Input;
    case Axis::SurroundMode: return Field::SurroundMode;
    case Axis::DisplayDim: return Field::DisplayDim;
    case Axis::PartyMode: return Field::PartyMode;
    case Axis::PartyVolume: return Field::PartyVolume;
    case Axis::TrebleEq: return Field::TrebleEq;
    case Axis::BassEq: return Field::BassEq;
    case Axis::RoomEq: return Field::RoomEq;
    case Axis::DialogEnhance: return Field::DialogEnhance;
    case Axis::DolbyAudioMode: return Field::DolbyAudioMode;
    case Axis::Drc: return Field::Drc;
  }
  return Field::Power;
}

std::optional<int> axisValue(const ReceiverState & s, Axis axis)
{
  switch (axis) {
    case Axis::Power: return asInt(s.power);
    case Axis::Volume: return s.volume;
    case Axis::Mute: return asInt(s.mute);
    case Axis::Input: return asInt(s.input);
    case Axis::SurroundMode: return asInt(s.surround_mode);
    case Axis::DisplayDim: return s.display_dim;
    case Axis::PartyMode: return asInt(s.party_mode);
    case Axis::PartyVolume: return s.party_volume;
    case Axis::TrebleEq: return s.treble_db;
    case Axis::BassEq: return s.bass_db;
    case Axis::RoomEq: return asInt(s.room_eq);
    case Axis::DialogEnhance: return asInt(s.dialog_enhance);
    case Axis::DolbyAudioMode: return asInt(s.dolby_audio_mode);
    case Axis::Drc: return asInt(s.drc);
  }
  return std::nullopt;
}

void setAxisValue(ReceiverState & s, Axis axis, std::optional<int> value)
{
  auto as_bool = [&value]() -> std::optional<bool> {
      if (!value) {return std::nullopt;}
      return *value != 0;
    };

  switch (axis) {
    case Axis::Power:
      s.power = value ? std::optional<PowerState>(static_cast<PowerState>(*value)) : std::nullopt;
      break;
    case Axis::Volume: s.volume = value; break;
    case Axis::Mute: s.mute = as_bool(); break;
    case Axis::Input:
      s.input = value ?
        std::optional<protocol::InputSource>(static_cast<protocol::InputSource>(*value)) :
        std::nullopt;
      break;
    case Axis::SurroundMode:
      s.surround_mode = value ?
        std::optional<protocol::SurroundMode>(static_cast<protocol::SurroundMode>(*value)) :
        std::nullopt;
      break;
    case Axis::DisplayDim: s.display_dim = value; break;
    case Axis::PartyMode: s.party_mode = as_bool(); break;
    case Axis::PartyVolume: s.party_volume = value; break;
    case Axis::TrebleEq: s.treble_db = value; break;
    case Axis::BassEq: s.bass_db = value; break;
    case Axis::RoomEq: s.room_eq = as_bool(); break;
    case Axis::DialogEnhance: s.dialog_enhance = as_bool(); break;
    case Axis::DolbyAudioMode: s.dolby_audio_mode = as_bool(); break;
    case Axis::Drc: s.drc = as_bool(); break;
  }
}

std::vector<FieldChange> diffStates(const ReceiverState & before, const ReceiverState & after)
{
  std::vector<FieldChange> changes;
  for (Field field : kAllFields) {
    auto b = fieldValue(before, field);
    auto a = fieldValue(after, field);
    bool differs = (a != b);
    if (field == Field::Version) {
      differs = before.version != after.version;
    }
    if (differs) {
      changes.push_back({field, a, fieldText(after, field)});
    }
  }
  return changes;
}

std::vector<FieldChange> describeState(const ReceiverState & state)
{
  std::vector<FieldChange> fields;
  fields.reserve(sizeof(kAllFields) / sizeof(kAllFields[0]));
  for (Field field : kAllFields) {
    fields.push_back({field, fieldValue(state, field), fieldText(state, field)});
  }
  return fields;
}

} // namespace state
} // namespace jblav
