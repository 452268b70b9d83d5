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

#ifndef JBLAV_UTILS__PROTOCOL__FRAME_HPP_
#define JBLAV_UTILS__PROTOCOL__FRAME_HPP_

#pragma once

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <vector>

#include "jblav_utils/protocol/constants.hpp"

namespace jblav
{
namespace protocol
{

// Host -> receiver: 0x23 <cmd> <len> <data...> 0x0D
struct CommandFrame
{
  CommandId command = CommandId::HEARTBEAT;
  std::vector<uint8_t> data;

  bool isQuery() const {return data.size() == 1 && data[0] == REQUEST_DATA;}

  bool operator==(const CommandFrame & other) const
  {
    return command == other.command && data == other.data;
  }
  bool operator!=(const CommandFrame & other) const {return !(*this == other);}
};

// Receiver -> host: 0x02 0x23 <cmd> <rsp> <len> <data...> 0x0D
struct ResponseFrame
{
  CommandId command = CommandId::HEARTBEAT;
  ResponseCode code = ResponseCode::STATUS_UPDATE;
  std::vector<uint8_t> data;

  bool isStatus() const {return code == ResponseCode::STATUS_UPDATE;}

  bool operator==(const ResponseFrame & other) const
  {
    return command == other.command && code == other.code && data == other.data;
  }
  bool operator!=(const ResponseFrame & other) const {return !(*this == other);}
};

// Byte span for input data
struct ByteSpan
{
  const uint8_t * data;
  size_t size;

  ByteSpan(const uint8_t * d, size_t s)
  : data(d), size(s) {}
  explicit ByteSpan(const std::vector<uint8_t> & v)
  : data(v.data()), size(v.size()) {}
};

enum class DecodeStatus
{
  FRAME,
  NEED_MORE_DATA,
  INVALID
};

// Detail for INVALID results, kept for diagnostics
enum class ParseResult
{
  SUCCESS,
  INSUFFICIENT_DATA,
  INVALID_START_BYTE,
  INVALID_RESPONSE_CODE,
  INVALID_LENGTH,
  MISSING_END_BYTE
};

template<typename FrameT>
struct DecodeResult
{
  DecodeStatus status = DecodeStatus::NEED_MORE_DATA;
  ParseResult detail = ParseResult::INSUFFICIENT_DATA;
  // FRAME: size of the frame. INVALID: bytes to drop to reach the next
  // start-marker candidate. NEED_MORE_DATA: always 0.
  size_t bytes_consumed = 0;
  FrameT frame;
};

using CommandDecodeResult = DecodeResult<CommandFrame>;
using ResponseDecodeResult = DecodeResult<ResponseFrame>;

// Throws EncodingError when the operand is longer than the command allows
std::vector<uint8_t> encodeCommand(const CommandFrame & frame);
// Throws EncodingError when data exceeds MAX_DATA_LENGTH
std::vector<uint8_t> encodeResponse(const ResponseFrame & frame);

ResponseDecodeResult decodeResponse(ByteSpan input);
CommandDecodeResult decodeCommand(ByteSpan input);

CommandFrame makeCommand(CommandId command, std::initializer_list<uint8_t> data = {});
CommandFrame makeQuery(CommandId command);
CommandFrame makeIrCommand(IrCode code);
ResponseFrame makeStatus(CommandId command, std::initializer_list<uint8_t> data = {});

/**
 * Incremental decoder for the receiver -> host byte stream.
 *
 * Bytes are appended with feed(); complete frames are taken out with pop().
 * Invalid frames are dropped and counted, and the decoder realigns on the
 * next start marker.
 */
class FrameDecoder
{
public:
  // Drop the oldest bytes when garbage accumulates past this bound
  static constexpr size_t MAX_BUFFERED = 4096;

  void feed(const uint8_t * data, size_t len);
  bool pop(ResponseFrame & out);
  void reset();

  size_t buffered() const {return buf_.size();}
  size_t invalidFrames() const {return invalid_frames_;}
  size_t discardedBytes() const {return discarded_bytes_;}

private:
  std::vector<uint8_t> buf_;
  size_t invalid_frames_ = 0;
  size_t discarded_bytes_ = 0;
};

} // namespace protocol
} // namespace jblav

#endif  // JBLAV_UTILS__PROTOCOL__FRAME_HPP_
