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

#ifndef JBLAV_UTILS__STATE__AXIS_HPP_
#define JBLAV_UTILS__STATE__AXIS_HPP_

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "jblav_utils/protocol/constants.hpp"

namespace jblav
{
namespace state
{

// One controllable dimension of receiver state. Each maps to one command ID.
enum class Axis
{
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
  Drc
};

static constexpr std::array<Axis, 14> kAllAxes = {
  Axis::Power, Axis::Volume, Axis::Mute, Axis::Input, Axis::SurroundMode,
  Axis::DisplayDim, Axis::PartyMode, Axis::PartyVolume, Axis::TrebleEq,
  Axis::BassEq, Axis::RoomEq, Axis::DialogEnhance, Axis::DolbyAudioMode, Axis::Drc};

// Integer form of power on an axis value
enum class PowerState : int
{
  Standby = 0,
  On = 1,
  GreenStandby = 2    // inferred, never on the wire
};

const char * axisName(Axis axis);
protocol::CommandId axisCommand(Axis axis);
std::optional<Axis> axisForCommand(protocol::CommandId command);

// Valid intent range for an axis (EQ axes are in dB)
int axisMinValue(Axis axis);
int axisMaxValue(Axis axis);

/**
 * Operand byte for an intent value.
 * Throws EncodingError when value is outside the axis range.
 */
uint8_t encodeAxisValue(Axis axis, int value);

// Intent value for a status operand byte, nullopt if the device sent garbage
std::optional<int> decodeAxisValue(Axis axis, uint8_t operand);

// "on", "HDMI 2", "-3 dB", ...
std::string axisValueText(Axis axis, int value);

} // namespace state
} // namespace jblav

#endif  // JBLAV_UTILS__STATE__AXIS_HPP_
