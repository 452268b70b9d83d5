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

#include "jblav_utils/protocol/constants.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace jblav
{
namespace protocol
{

// Lowercase and drop everything that is not a letter or digit:
// "HDMI 2", "hdmi_2" and "hdmi2" all normalize to "hdmi2"
static std::string normalize(const std::string & s)
{
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {out.push_back(static_cast<char>(std::tolower(uc)));}
  }
  return out;
}

size_t maxOperandLength(CommandId command)
{
  switch (command) {
    case CommandId::HEARTBEAT:
    case CommandId::REBOOT:
    case CommandId::FACTORY_RESET:
      return 0;
    case CommandId::SIMULATE_IR:
      return 3;
    default:
      return 1;
  }
}

bool isKnownCommand(uint8_t command)
{
  return (command <= static_cast<uint8_t>(CommandId::STREAMING_STATE) && command != 0x03) ||
         (command >= static_cast<uint8_t>(CommandId::INITIALIZATION) &&
         command <= static_cast<uint8_t>(CommandId::FACTORY_RESET));
}

bool isErrorResponse(ResponseCode code)
{
  return code != ResponseCode::STATUS_UPDATE;
}

const char * commandName(CommandId command)
{
  switch (command) {
    case CommandId::POWER: return "POWER";
    case CommandId::DISPLAY_DIM: return "DISPLAY_DIM";
    case CommandId::VERSION: return "VERSION";
    case CommandId::SIMULATE_IR: return "SIMULATE_IR";
    case CommandId::INPUT_SOURCE: return "INPUT_SOURCE";
    case CommandId::VOLUME: return "VOLUME";
    case CommandId::MUTE: return "MUTE";
    case CommandId::SURROUND_MODE: return "SURROUND_MODE";
    case CommandId::PARTY_MODE: return "PARTY_MODE";
    case CommandId::PARTY_VOLUME: return "PARTY_VOLUME";
    case CommandId::TREBLE_EQ: return "TREBLE_EQ";
    case CommandId::BASS_EQ: return "BASS_EQ";
    case CommandId::ROOM_EQ: return "ROOM_EQ";
    case CommandId::DIALOG_ENHANCE: return "DIALOG_ENHANCE";
    case CommandId::DOLBY_AUDIO_MODE: return "DOLBY_AUDIO_MODE";
    case CommandId::DRC: return "DRC";
    case CommandId::STREAMING_STATE: return "STREAMING_STATE";
    case CommandId::INITIALIZATION: return "INITIALIZATION";
    case CommandId::HEARTBEAT: return "HEARTBEAT";
    case CommandId::REBOOT: return "REBOOT";
    case CommandId::FACTORY_RESET: return "FACTORY_RESET";
  }
  return "UNKNOWN";
}

const char * responseCodeName(ResponseCode code)
{
  switch (code) {
    case ResponseCode::STATUS_UPDATE: return "STATUS_UPDATE";
    case ResponseCode::COMMAND_NOT_RECOGNIZED: return "COMMAND_NOT_RECOGNIZED";
    case ResponseCode::PARAMETER_NOT_RECOGNIZED: return "PARAMETER_NOT_RECOGNIZED";
    case ResponseCode::COMMAND_INVALID: return "COMMAND_INVALID";
    case ResponseCode::INVALID_DATA_LENGTH: return "INVALID_DATA_LENGTH";
  }
  return "UNKNOWN";
}

const char * modelName(Model model)
{
  switch (model) {
    case Model::MA510: return "MA510";
    case Model::MA710: return "MA710";
    case Model::MA7100HP: return "MA7100HP";
    case Model::MA9100HP: return "MA9100HP";
  }
  return "Unknown";
}

const char * inputSourceName(InputSource source)
{
  switch (source) {
    case InputSource::TV_ARC: return "TV (ARC)";
    case InputSource::HDMI_1: return "HDMI 1";
    case InputSource::HDMI_2: return "HDMI 2";
    case InputSource::HDMI_3: return "HDMI 3";
    case InputSource::HDMI_4: return "HDMI 4";
    case InputSource::HDMI_5: return "HDMI 5";
    case InputSource::HDMI_6: return "HDMI 6";
    case InputSource::COAX: return "Coax";
    case InputSource::OPTICAL: return "Optical";
    case InputSource::ANALOG_1: return "Analog 1";
    case InputSource::ANALOG_2: return "Analog 2";
    case InputSource::PHONO: return "Phono";
    case InputSource::BLUETOOTH: return "Bluetooth";
    case InputSource::NETWORK: return "Network";
  }
  return "Unknown";
}

const char * surroundModeName(SurroundMode mode)
{
  switch (mode) {
    case SurroundMode::DOLBY_SURROUND: return "Dolby Surround";
    case SurroundMode::DTS_NEURAL_X: return "DTS Neural:X";
    case SurroundMode::STEREO_2_0: return "Stereo 2.0";
    case SurroundMode::STEREO_2_1: return "Stereo 2.1";
    case SurroundMode::ALL_STEREO: return "All Stereo";
    case SurroundMode::NATIVE: return "Native";
    case SurroundMode::DOLBY_PROLOGIC_II: return "Dolby Pro Logic II";
  }
  return "Unknown";
}

std::optional<InputSource> inputSourceFromString(const std::string & name)
{
  const std::string key = normalize(name);
  if (key == "tv") {return InputSource::TV_ARC;}
  for (uint8_t v = static_cast<uint8_t>(InputSource::TV_ARC);
    v <= static_cast<uint8_t>(InputSource::NETWORK); ++v)
  {
    auto source = static_cast<InputSource>(v);
    if (normalize(inputSourceName(source)) == key) {return source;}
  }
  return std::nullopt;
}

std::optional<SurroundMode> surroundModeFromString(const std::string & name)
{
  const std::string key = normalize(name);
  for (uint8_t v = static_cast<uint8_t>(SurroundMode::DOLBY_SURROUND);
    v <= static_cast<uint8_t>(SurroundMode::DOLBY_PROLOGIC_II); ++v)
  {
    auto mode = static_cast<SurroundMode>(v);
    if (normalize(surroundModeName(mode)) == key) {return mode;}
  }
  if (key == "dolby") {return SurroundMode::DOLBY_SURROUND;}
  if (key == "neuralx" || key == "dts") {return SurroundMode::DTS_NEURAL_X;}
  if (key == "stereo") {return SurroundMode::STEREO_2_0;}
  return std::nullopt;
}

std::optional<IrCode> irCodeFromString(const std::string & name)
{
  static const std::pair<const char *, IrCode> kTable[] = {
    {"power", IrCode::POWER}, {"up", IrCode::UP}, {"down", IrCode::DOWN},
    {"left", IrCode::LEFT}, {"right", IrCode::RIGHT}, {"ok", IrCode::OK},
    {"enter", IrCode::OK}, {"menu", IrCode::MENU}, {"back", IrCode::BACK},
    {"dim", IrCode::DIM}, {"volup", IrCode::VOL_UP}, {"voldown", IrCode::VOL_DOWN},
    {"mute", IrCode::MUTE}, {"sourceup", IrCode::SOURCE_UP},
    {"sourcedown", IrCode::SOURCE_DOWN}, {"surrup", IrCode::SURR_UP},
    {"surrdown", IrCode::SURR_DOWN}, {"poweron", IrCode::MAIN_POWER_ON},
    {"poweroff", IrCode::MAIN_POWER_OFF}, {"partyon", IrCode::PARTY_ON},
    {"partyoff", IrCode::PARTY_OFF}, {"partyvolup", IrCode::PARTY_VOL_UP},
    {"partyvoldown", IrCode::PARTY_VOL_DOWN},
  };
  const std::string key = normalize(name);
  auto it = std::find_if(
    std::begin(kTable), std::end(kTable),
    [&key](const std::pair<const char *, IrCode> & entry) {return key == entry.first;});
  if (it == std::end(kTable)) {return std::nullopt;}
  return it->second;
}

} // namespace protocol
} // namespace jblav
