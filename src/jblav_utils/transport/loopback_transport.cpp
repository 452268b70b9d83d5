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

#include "jblav_utils/transport/loopback_transport.hpp"

#include <algorithm>
#include <chrono>

namespace jblav
{
namespace transport
{

using protocol::CommandId;
using protocol::ResponseCode;

OpenResult LoopbackTransport::open(const TransportOptions & opts)
{
  std::lock_guard<std::mutex> lock(mutex_);
  opts_ = opts;
  ++open_count_;
  if (open_result_ != OpenResult::OK) {
    return open_result_;
  }
  is_open_ = true;
  peer_closed_ = false;
  input_queue_.clear();
  tx_buffer_.clear();
  return OpenResult::OK;
}

void LoopbackTransport::close()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    is_open_ = false;
    input_queue_.clear();
    tx_buffer_.clear();
  }
  rx_cv_.notify_all();
}

bool LoopbackTransport::is_open() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return is_open_;
}

int LoopbackTransport::read(uint8_t * buf, size_t len)
{
  std::unique_lock<std::mutex> lock(mutex_);
  if (opts_.read_timeout_ms > 0) {
    rx_cv_.wait_for(
      lock, std::chrono::milliseconds(opts_.read_timeout_ms),
      [this] {return !input_queue_.empty() || peer_closed_ || !is_open_;});
  }

  if (!is_open_) {
    return kReadError;
  }
  if (input_queue_.empty()) {
    return peer_closed_ ? kPeerClosed : 0;
  }

  size_t bytes_read = 0;
  while (bytes_read < len && !input_queue_.empty()) {
    buf[bytes_read++] = input_queue_.front();
    input_queue_.pop_front();
  }
  return static_cast<int>(bytes_read);
}

int LoopbackTransport::write(const uint8_t * buf, size_t len)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_ || peer_closed_) {
      return -1;
    }
    if (fail_next_write_) {
      fail_next_write_ = false;
      return -1;
    }

    tx_buffer_.insert(tx_buffer_.end(), buf, buf + len);
    for (;;) {
      auto result = protocol::decodeCommand(protocol::ByteSpan(tx_buffer_));
      if (result.status == protocol::DecodeStatus::NEED_MORE_DATA) {
        break;
      }
      tx_buffer_.erase(
        tx_buffer_.begin(),
        tx_buffer_.begin() + static_cast<std::ptrdiff_t>(result.bytes_consumed));
      if (result.status == protocol::DecodeStatus::FRAME) {
        written_.push_back(result.frame);
        if (auto_respond_) {
          processCommand(result.frame);
        }
      }
    }
  }
  rx_cv_.notify_all();
  return static_cast<int>(len);
}

void LoopbackTransport::setAutoRespond(bool enabled)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto_respond_ = enabled;
}

void LoopbackTransport::setOpenResult(OpenResult result)
{
  std::lock_guard<std::mutex> lock(mutex_);
  open_result_ = result;
}

void LoopbackTransport::setRefuseConnections(bool refuse)
{
  setOpenResult(refuse ? OpenResult::REFUSED : OpenResult::OK);
}

void LoopbackTransport::injectBytes(const uint8_t * data, size_t len)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    input_queue_.insert(input_queue_.end(), data, data + len);
  }
  rx_cv_.notify_all();
}

void LoopbackTransport::injectResponse(const protocol::ResponseFrame & frame)
{
  auto bytes = protocol::encodeResponse(frame);
  injectBytes(bytes.data(), bytes.size());
}

void LoopbackTransport::simulatePeerClose()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    peer_closed_ = true;
  }
  rx_cv_.notify_all();
}

void LoopbackTransport::failNextWrite()
{
  std::lock_guard<std::mutex> lock(mutex_);
  fail_next_write_ = true;
}

std::vector<protocol::CommandFrame> LoopbackTransport::writtenFrames() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return written_;
}

size_t LoopbackTransport::writtenCount(CommandId command) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
    std::count_if(
      written_.begin(), written_.end(),
      [command](const protocol::CommandFrame & f) {return f.command == command;}));
}

void LoopbackTransport::clearWritten()
{
  std::lock_guard<std::mutex> lock(mutex_);
  written_.clear();
}

size_t LoopbackTransport::openCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return open_count_;
}

LoopbackTransport::DeviceState LoopbackTransport::device() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return device_;
}

void LoopbackTransport::setDevice(const DeviceState & state)
{
  std::lock_guard<std::mutex> lock(mutex_);
  device_ = state;
}

void LoopbackTransport::respond(
  CommandId command, ResponseCode code,
  const std::vector<uint8_t> & data)
{
  protocol::ResponseFrame frame;
  frame.command = command;
  frame.code = code;
  frame.data = data;
  auto bytes = protocol::encodeResponse(frame);
  input_queue_.insert(input_queue_.end(), bytes.begin(), bytes.end());
}

uint8_t * LoopbackTransport::axisField(CommandId command)
{
  switch (command) {
    case CommandId::POWER: return &device_.power;
    case CommandId::DISPLAY_DIM: return &device_.display_dim;
    case CommandId::INPUT_SOURCE: return &device_.input;
    case CommandId::VOLUME: return &device_.volume;
    case CommandId::MUTE: return &device_.mute;
    case CommandId::SURROUND_MODE: return &device_.surround;
    case CommandId::PARTY_MODE: return &device_.party_mode;
    case CommandId::PARTY_VOLUME: return &device_.party_volume;
    case CommandId::TREBLE_EQ: return &device_.treble;
    case CommandId::BASS_EQ: return &device_.bass;
    case CommandId::ROOM_EQ: return &device_.room_eq;
    case CommandId::DIALOG_ENHANCE: return &device_.dialog_enhance;
    case CommandId::DOLBY_AUDIO_MODE: return &device_.dolby_audio_mode;
    case CommandId::DRC: return &device_.drc;
    case CommandId::STREAMING_STATE: return &device_.streaming_state;
    default: return nullptr;
  }
}

// Highest operand value the simulated device accepts for a setter
static uint8_t maxOperand(CommandId command)
{
  switch (command) {
    case CommandId::VOLUME:
    case CommandId::PARTY_VOLUME:
      return 99;
    case CommandId::TREBLE_EQ:
    case CommandId::BASS_EQ:
      return 12;
    case CommandId::DISPLAY_DIM:
      return 3;
    case CommandId::INPUT_SOURCE:
      return static_cast<uint8_t>(protocol::InputSource::NETWORK);
    case CommandId::SURROUND_MODE:
      return static_cast<uint8_t>(protocol::SurroundMode::DOLBY_PROLOGIC_II);
    default:
      return 1;
  }
}

void LoopbackTransport::processCommand(const protocol::CommandFrame & cmd)
{
  if (!protocol::isKnownCommand(static_cast<uint8_t>(cmd.command))) {
    respond(cmd.command, ResponseCode::COMMAND_NOT_RECOGNIZED, {});
    return;
  }
  if (cmd.data.size() != protocol::maxOperandLength(cmd.command)) {
    respond(cmd.command, ResponseCode::INVALID_DATA_LENGTH, {});
    return;
  }

  switch (cmd.command) {
    case CommandId::HEARTBEAT:
    case CommandId::REBOOT:
    case CommandId::FACTORY_RESET:
      respond(cmd.command, ResponseCode::STATUS_UPDATE, {});
      return;
    case CommandId::INITIALIZATION:
      respond(cmd.command, ResponseCode::STATUS_UPDATE, {static_cast<uint8_t>(device_.model)});
      return;
    case CommandId::VERSION:
      respond(cmd.command, ResponseCode::STATUS_UPDATE, device_.version);
      return;
    case CommandId::SIMULATE_IR:
    {
      respond(cmd.command, ResponseCode::STATUS_UPDATE, cmd.data);
      const uint32_t code = (static_cast<uint32_t>(cmd.data[0]) << 16) |
        (static_cast<uint32_t>(cmd.data[1]) << 8) | cmd.data[2];
      // Volume keys move the level and the device pushes the new value
      if (code == static_cast<uint32_t>(protocol::IrCode::VOL_UP) && device_.volume < 99) {
        ++device_.volume;
        respond(CommandId::VOLUME, ResponseCode::STATUS_UPDATE, {device_.volume});
      } else if (code == static_cast<uint32_t>(protocol::IrCode::VOL_DOWN) && device_.volume > 0) {
        --device_.volume;
        respond(CommandId::VOLUME, ResponseCode::STATUS_UPDATE, {device_.volume});
      }
      return;
    }
    default:
      break;
  }

  uint8_t * field = axisField(cmd.command);
  if (field == nullptr) {
    respond(cmd.command, ResponseCode::COMMAND_NOT_RECOGNIZED, {});
    return;
  }
  if (cmd.isQuery()) {
    respond(cmd.command, ResponseCode::STATUS_UPDATE, {*field});
    return;
  }
  if (cmd.command == CommandId::STREAMING_STATE) {
    respond(cmd.command, ResponseCode::COMMAND_INVALID, {});
    return;
  }

  const uint8_t value = cmd.data[0];
  const bool one_based = cmd.command == CommandId::INPUT_SOURCE ||
    cmd.command == CommandId::SURROUND_MODE;
  if (value > maxOperand(cmd.command) || (one_based && value == 0)) {
    respond(cmd.command, ResponseCode::PARAMETER_NOT_RECOGNIZED, {});
    return;
  }
  *field = value;
  respond(cmd.command, ResponseCode::STATUS_UPDATE, {value});
}

} // namespace transport
} // namespace jblav
