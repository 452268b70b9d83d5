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

#ifndef JBLAV_UTILS__TRANSPORT__LOOPBACK_TRANSPORT_HPP_
#define JBLAV_UTILS__TRANSPORT__LOOPBACK_TRANSPORT_HPP_

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/transport/transport.hpp"

namespace jblav
{
namespace transport
{

/**
 * @brief Transport that simulates a receiver in memory
 *
 * Command frames written to it are decoded and answered the way the device
 * answers them: setters update the simulated state and echo a status frame,
 * queries report the current value, malformed operands get an error code.
 * Useful for integration testing and for running the monitor without
 * hardware.
 */
class LoopbackTransport : public Transport
{
public:
  struct DeviceState
  {
    uint8_t power = 1;
    uint8_t display_dim = 2;
    uint8_t input = static_cast<uint8_t>(protocol::InputSource::HDMI_1);
    uint8_t volume = 30;
    uint8_t mute = 0;
    uint8_t surround = static_cast<uint8_t>(protocol::SurroundMode::NATIVE);
    uint8_t party_mode = 0;
    uint8_t party_volume = 30;
    uint8_t treble = 6;      // 0 dB
    uint8_t bass = 6;
    uint8_t room_eq = 1;
    uint8_t dialog_enhance = 0;
    uint8_t dolby_audio_mode = 0;
    uint8_t drc = 0;
    uint8_t streaming_state = 0;
    protocol::Model model = protocol::Model::MA710;
    std::vector<uint8_t> version{1, 7};
  };

  LoopbackTransport() = default;
  ~LoopbackTransport() override = default;

  OpenResult open(const TransportOptions & opts) override;
  void close() override;
  bool is_open() const override;

  int read(uint8_t * buf, size_t len) override;
  int write(const uint8_t * buf, size_t len) override;

  // Answer commands automatically (default true)
  void setAutoRespond(bool enabled);
  // Result returned by every following open(); OK restores normal behavior
  void setOpenResult(OpenResult result);
  void setRefuseConnections(bool refuse);

  // Queue raw bytes or an encoded frame for the host to read
  void injectBytes(const uint8_t * data, size_t len);
  void injectResponse(const protocol::ResponseFrame & frame);

  // The next read reports an orderly close by the peer
  void simulatePeerClose();
  void failNextWrite();

  std::vector<protocol::CommandFrame> writtenFrames() const;
  size_t writtenCount(protocol::CommandId command) const;
  void clearWritten();
  size_t openCount() const;

  DeviceState device() const;
  void setDevice(const DeviceState & state);

private:
  // Called with mutex_ held
  void processCommand(const protocol::CommandFrame & cmd);
  void respond(
    protocol::CommandId command, protocol::ResponseCode code,
    const std::vector<uint8_t> & data);
  uint8_t * axisField(protocol::CommandId command);

  mutable std::mutex mutex_;
  std::condition_variable rx_cv_;
  TransportOptions opts_{};
  bool is_open_ = false;
  bool auto_respond_ = true;
  bool peer_closed_ = false;
  bool fail_next_write_ = false;
  OpenResult open_result_ = OpenResult::OK;
  size_t open_count_ = 0;

  std::deque<uint8_t> input_queue_;
  std::vector<uint8_t> tx_buffer_;
  std::vector<protocol::CommandFrame> written_;
  DeviceState device_;
};

} // namespace transport
} // namespace jblav

#endif  // JBLAV_UTILS__TRANSPORT__LOOPBACK_TRANSPORT_HPP_
