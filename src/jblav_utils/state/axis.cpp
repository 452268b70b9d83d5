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

#include "jblav_utils/state/axis.hpp"

#include "jblav_utils/errors.hpp"

namespace jblav
{
namespace state
{

using protocol::CommandId;

static constexpr int kEqOffset = 6;

const char * axisName(Axis axis)
{
  switch (axis) {
    case Axis::Power: return "power";
    case Axis::Volume: return "volume";
    case Axis::Mute: return "mute";
    case Axis::Input: return "input";
    case Axis::SurroundMode: return "surround_mode";
    case Axis::DisplayDim: return "display_dim";
    case Axis::PartyMode: return "party_mode";
    case Axis::PartyVolume: return "party_volume";
    case Axis::TrebleEq: return "treble_eq";
    case Axis::BassEq: return "bass_eq";
    case Axis::RoomEq: return "room_eq";
    case Axis::DialogEnhance: return "dialog_enhance";
    case Axis::DolbyAudioMode: return "dolby_audio_mode";
    case Axis::Drc: return "drc";
  }
  return "unknown";
}

CommandId axisCommand(Axis axis)
{
  switch (axis) {
    case Axis::Power: return CommandId::POWER;
    case Axis::Volume: return CommandId::VOLUME;
    case Axis::Mute: return CommandId::MUTE;
    case Axis::Input: return CommandId::INPUT_SOURCE;
    case Axis::SurroundMode: return CommandId::SURROUND_MODE;
    case Axis::DisplayDim: return CommandId::DISPLAY_DIM;
    case Axis::PartyMode: return CommandId::PARTY_MODE;
    case Axis::PartyVolume: return CommandId::PARTY_VOLUME;
    case Axis::TrebleEq: return CommandId::TREBLE_EQ;
    case Axis::BassEq: return CommandId::BASS_EQ;
    case Axis::RoomEq: return CommandId::ROOM_EQ;
    case Axis::DialogEnhance: return CommandId::DIALOG_ENHANCE;
    case Axis::DolbyAudioMode: return CommandId::DOLBY_AUDIO_MODE;
    case Axis::Drc: return CommandId::DRC;
  }
  return CommandId::POWER;
}

std::optional<Axis> axisForCommand(CommandId command)
{
  for (Axis axis : kAllAxes) {
    if (axisCommand(axis) == command) {
      return axis;
    }
  }
  return std::nullopt;
}

int axisMinValue(Axis axis)
{
  switch (axis) {
    case Axis::Input:
      return static_cast<int>(protocol::InputSource::TV_ARC);
    case Axis::SurroundMode:
      return static_cast<int>(protocol::SurroundMode::DOLBY_SURROUND);
    case Axis::TrebleEq:
    case Axis::BassEq:
      return -kEqOffset;
    default:
      return 0;
  }
}

int axisMaxValue(Axis axis)
{
  switch (axis) {
    case Axis::Volume:
    case Axis::PartyVolume:
      return 99;
    case Axis::Input:
      return static_cast<int>(protocol::InputSource::NETWORK);
    case Axis::SurroundMode:
      return static_cast<int>(protocol::SurroundMode::DOLBY_PROLOGIC_II);
    case Axis::DisplayDim:
      return 3;
    case Axis::TrebleEq:
    case Axis::BassEq:
      return kEqOffset;
    default:
      return 1;
  }
}

uint8_t encodeAxisValue(Axis axis, int value)
{
  if (value < axisMinValue(axis) || value > axisMaxValue(axis)) {
    throw EncodingError(
            std::string(axisName(axis)) + " value " + std::to_string(value) +
            " outside " + std::to_string(axisMinValue(axis)) + ".." +
            std::to_string(axisMaxValue(axis)));
  }
  if (axis == Axis::TrebleEq || axis == Axis::BassEq) {
    return static_cast<uint8_t>(value + kEqOffset);
  }
  return static_cast<uint8_t>(value);
}

std::optional<int> decodeAxisValue(Axis axis, uint8_t operand)
{
  int value = operand;
  if (axis == Axis::TrebleEq || axis == Axis::BassEq) {
    value -= kEqOffset;
  }
  if (value < axisMinValue(axis) || value > axisMaxValue(axis)) {
    return std::nullopt;
  }
  return value;
}

std::string axisValueText(Axis axis, int value)
{
  switch (axis) {
    case Axis::Power:
      switch (static_cast<PowerState>(value)) {
        case PowerState::On: return "on";
        case PowerState::Standby: return "standby";
        case PowerState::GreenStandby: return "green standby";
      }
      return "unknown";
    case Axis::Input:
      return protocol::inputSourceName(static_cast<protocol::InputSource>(value));
    case Axis::SurroundMode:
      return protocol::surroundModeName(static_cast<protocol::SurroundMode>(value));
    case Axis::DisplayDim:
    {
      static const char * kLevels[] = {"off", "dim", "mid", "bright"};
      return (value >= 0 && value <= 3) ? kLevels[value] : "unknown";
    }
    case Axis::TrebleEq:
    case Axis::BassEq:
      return (value > 0 ? "+" : "") + std::to_string(value) + " dB";
    case Axis::Volume:
    case Axis::PartyVolume:
      return std::to_string(value);
    default:
      return value ? "on" : "off";
  }
}

} // namespace state
} // namespace jblav
