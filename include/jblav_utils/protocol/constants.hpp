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

#ifndef JBLAV_UTILS__PROTOCOL__CONSTANTS_HPP_
#define JBLAV_UTILS__PROTOCOL__CONSTANTS_HPP_

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

namespace jblav
{
namespace protocol
{

// JBL IP Control protocol v1.7 (MA510 / MA710 / MA7100HP / MA9100HP)
static constexpr uint16_t CONTROL_PORT = 50000;

static constexpr uint8_t COMMAND_START = 0x23;
static constexpr uint8_t RESPONSE_PREFIX = 0x02;   // response start is 0x02 0x23
static constexpr uint8_t FRAME_END = 0x0D;
static constexpr uint8_t REQUEST_DATA = 0xF0;      // "report current value"

static constexpr size_t COMMAND_HEADER_SIZE = 3;   // start + cmd + len
static constexpr size_t RESPONSE_HEADER_SIZE = 5;  // start(2) + cmd + rsp + len
static constexpr size_t MAX_DATA_LENGTH = 64;

enum class CommandId : uint8_t
{
  POWER = 0x00,
  DISPLAY_DIM = 0x01,
  VERSION = 0x02,
  SIMULATE_IR = 0x04,
  INPUT_SOURCE = 0x05,
  VOLUME = 0x06,
  MUTE = 0x07,
  SURROUND_MODE = 0x08,
  PARTY_MODE = 0x09,
  PARTY_VOLUME = 0x0A,
  TREBLE_EQ = 0x0B,
  BASS_EQ = 0x0C,
  ROOM_EQ = 0x0D,
  DIALOG_ENHANCE = 0x0E,
  DOLBY_AUDIO_MODE = 0x0F,
  DRC = 0x10,
  STREAMING_STATE = 0x11,
  INITIALIZATION = 0x50,
  HEARTBEAT = 0x51,
  REBOOT = 0x52,
  FACTORY_RESET = 0x53
};

enum class ResponseCode : uint8_t
{
  STATUS_UPDATE = 0x00,
  COMMAND_NOT_RECOGNIZED = 0xC1,
  PARAMETER_NOT_RECOGNIZED = 0xC2,
  COMMAND_INVALID = 0xC3,
  INVALID_DATA_LENGTH = 0xC4
};

enum class Model : uint8_t
{
  MA510 = 0x01,
  MA710 = 0x02,
  MA7100HP = 0x03,
  MA9100HP = 0x04
};

enum class InputSource : uint8_t
{
  TV_ARC = 0x01,
  HDMI_1 = 0x02,
  HDMI_2 = 0x03,
  HDMI_3 = 0x04,
  HDMI_4 = 0x05,
  HDMI_5 = 0x06,    // MA710 and up
  HDMI_6 = 0x07,    // MA710 and up
  COAX = 0x08,
  OPTICAL = 0x09,
  ANALOG_1 = 0x0A,
  ANALOG_2 = 0x0B,
  PHONO = 0x0C,     // MA710 and up
  BLUETOOTH = 0x0D,
  NETWORK = 0x0E
};

enum class SurroundMode : uint8_t
{
  DOLBY_SURROUND = 0x01,      // MA710 and up
  DTS_NEURAL_X = 0x02,        // MA710 and up
  STEREO_2_0 = 0x03,
  STEREO_2_1 = 0x04,
  ALL_STEREO = 0x05,
  NATIVE = 0x06,
  DOLBY_PROLOGIC_II = 0x07    // MA510 only
};

// Version query selectors for CommandId::VERSION
enum class VersionType : uint8_t
{
  IP_CONTROL = 0xF0,
  HOST = 0xF1,
  DSP = 0xF2,
  OSD = 0xF3,
  NET = 0xF4
};

// NEC-encoded (24-bit) remote control codes accepted by SIMULATE_IR
enum class IrCode : uint32_t
{
  POWER = 0x010E03,
  UP = 0x010E99,
  DOWN = 0x010E59,
  LEFT = 0x010E83,
  RIGHT = 0x010E43,
  OK = 0x010E21,
  MENU = 0x010ECA,
  BACK = 0x010EA1,
  DIM = 0x010EC9,
  VOL_UP = 0x010EE3,
  VOL_DOWN = 0x010E13,
  MUTE = 0x010EC3,
  SOURCE_UP = 0x010E8C,
  SOURCE_DOWN = 0x010E0C,
  SURR_UP = 0x010EF4,
  SURR_DOWN = 0x010E74,
  MAIN_POWER_ON = 0x010ED9,
  MAIN_POWER_OFF = 0x010EF9,
  TV = 0x010E71,
  HDMI1 = 0x010E11,
  HDMI2 = 0x010E91,
  HDMI3 = 0x010E51,
  HDMI4 = 0x010ED1,
  HDMI5 = 0x010E31,
  HDMI6 = 0x010EB1,
  COAX = 0x010E81,
  OPTICAL = 0x010EDB,
  ANALOG1 = 0x010E23,
  ANALOG2 = 0x010E33,
  PHONO = 0x010E0B,
  BLUETOOTH = 0x010E53,
  NETWORK = 0x010ED3,
  PARTY_ON = 0x010E73,
  PARTY_OFF = 0x010E8B,
  PARTY_VOL_UP = 0x010E39,
  PARTY_VOL_DOWN = 0x010EB9
};

// Number of operand bytes a command may carry on the wire
size_t maxOperandLength(CommandId command);

bool isKnownCommand(uint8_t command);
bool isErrorResponse(ResponseCode code);

const char * commandName(CommandId command);
const char * responseCodeName(ResponseCode code);
const char * modelName(Model model);
const char * inputSourceName(InputSource source);
const char * surroundModeName(SurroundMode mode);

// Case-insensitive lookup; accepts display names and compact forms ("hdmi2", "tv")
std::optional<InputSource> inputSourceFromString(const std::string & name);
std::optional<SurroundMode> surroundModeFromString(const std::string & name);
std::optional<IrCode> irCodeFromString(const std::string & name);

} // namespace protocol
} // namespace jblav

#endif  // JBLAV_UTILS__PROTOCOL__CONSTANTS_HPP_
