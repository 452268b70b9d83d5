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

#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/errors.hpp"

#include <algorithm>
#include <string>

namespace jblav
{
namespace protocol
{

// Offset of the next byte equal to marker after position 0, or input.size
static size_t resyncOffset(ByteSpan input, uint8_t marker)
{
  for (size_t i = 1; i < input.size; ++i) {
    if (input.data[i] == marker) {
      return i;
    }
  }
  return input.size;
}

static bool isValidResponseCode(uint8_t code)
{
  return code == static_cast<uint8_t>(ResponseCode::STATUS_UPDATE) ||
         (code >= static_cast<uint8_t>(ResponseCode::COMMAND_NOT_RECOGNIZED) &&
         code <= static_cast<uint8_t>(ResponseCode::INVALID_DATA_LENGTH));
}

template<typename FrameT>
static DecodeResult<FrameT> invalid(ParseResult detail, size_t skip)
{
  DecodeResult<FrameT> result;
  result.status = DecodeStatus::INVALID;
  result.detail = detail;
  result.bytes_consumed = skip;
  return result;
}

std::vector<uint8_t> encodeCommand(const CommandFrame & frame)
{
  const size_t allowed = maxOperandLength(frame.command);
  if (frame.data.size() > allowed) {
    throw EncodingError(
            std::string("operand too long for ") + commandName(frame.command) + ": " +
            std::to_string(frame.data.size()) + " > " + std::to_string(allowed));
  }

  // Frame structure: START + CMD + LEN + DATA + END
  std::vector<uint8_t> buffer;
  buffer.reserve(COMMAND_HEADER_SIZE + frame.data.size() + 1);
  buffer.push_back(COMMAND_START);
  buffer.push_back(static_cast<uint8_t>(frame.command));
  buffer.push_back(static_cast<uint8_t>(frame.data.size()));
  buffer.insert(buffer.end(), frame.data.begin(), frame.data.end());
  buffer.push_back(FRAME_END);
  return buffer;
}

std::vector<uint8_t> encodeResponse(const ResponseFrame & frame)
{
  if (frame.data.size() > MAX_DATA_LENGTH) {
    throw EncodingError("response data too long: " + std::to_string(frame.data.size()));
  }

  // Frame structure: PREFIX + START + CMD + RSP + LEN + DATA + END
  std::vector<uint8_t> buffer;
  buffer.reserve(RESPONSE_HEADER_SIZE + frame.data.size() + 1);
  buffer.push_back(RESPONSE_PREFIX);
  buffer.push_back(COMMAND_START);
  buffer.push_back(static_cast<uint8_t>(frame.command));
  buffer.push_back(static_cast<uint8_t>(frame.code));
  buffer.push_back(static_cast<uint8_t>(frame.data.size()));
  buffer.insert(buffer.end(), frame.data.begin(), frame.data.end());
  buffer.push_back(FRAME_END);
  return buffer;
}

ResponseDecodeResult decodeResponse(ByteSpan input)
{
  ResponseDecodeResult result;
  if (input.size == 0) {
    return result;
  }

  // Start is two bytes: 0x02 0x23
  if (input.data[0] != RESPONSE_PREFIX) {
    return invalid<ResponseFrame>(
      ParseResult::INVALID_START_BYTE,
      resyncOffset(input, RESPONSE_PREFIX));
  }
  if (input.size >= 2 && input.data[1] != COMMAND_START) {
    return invalid<ResponseFrame>(
      ParseResult::INVALID_START_BYTE,
      resyncOffset(input, RESPONSE_PREFIX));
  }
  if (input.size >= 4 && !isValidResponseCode(input.data[3])) {
    return invalid<ResponseFrame>(
      ParseResult::INVALID_RESPONSE_CODE,
      resyncOffset(input, RESPONSE_PREFIX));
  }
  if (input.size < RESPONSE_HEADER_SIZE) {
    return result;
  }

  const uint8_t data_len = input.data[4];
  if (data_len > MAX_DATA_LENGTH) {
    return invalid<ResponseFrame>(
      ParseResult::INVALID_LENGTH,
      resyncOffset(input, RESPONSE_PREFIX));
  }

  const size_t total = RESPONSE_HEADER_SIZE + data_len + 1;
  if (input.size < total) {
    return result;
  }

  // The terminator must sit exactly where the declared length puts it
  if (input.data[total - 1] != FRAME_END) {
    return invalid<ResponseFrame>(
      ParseResult::MISSING_END_BYTE,
      resyncOffset(input, RESPONSE_PREFIX));
  }

  result.status = DecodeStatus::FRAME;
  result.detail = ParseResult::SUCCESS;
  result.bytes_consumed = total;
  result.frame.command = static_cast<CommandId>(input.data[2]);
  result.frame.code = static_cast<ResponseCode>(input.data[3]);
  result.frame.data.assign(
    input.data + RESPONSE_HEADER_SIZE,
    input.data + RESPONSE_HEADER_SIZE + data_len);
  return result;
}

CommandDecodeResult decodeCommand(ByteSpan input)
{
  CommandDecodeResult result;
  if (input.size == 0) {
    return result;
  }

  if (input.data[0] != COMMAND_START) {
    return invalid<CommandFrame>(
      ParseResult::INVALID_START_BYTE,
      resyncOffset(input, COMMAND_START));
  }
  if (input.size < COMMAND_HEADER_SIZE) {
    return result;
  }

  const uint8_t data_len = input.data[2];
  if (data_len > MAX_DATA_LENGTH) {
    return invalid<CommandFrame>(
      ParseResult::INVALID_LENGTH,
      resyncOffset(input, COMMAND_START));
  }

  const size_t total = COMMAND_HEADER_SIZE + data_len + 1;
  if (input.size < total) {
    return result;
  }

  if (input.data[total - 1] != FRAME_END) {
    return invalid<CommandFrame>(
      ParseResult::MISSING_END_BYTE,
      resyncOffset(input, COMMAND_START));
  }

  result.status = DecodeStatus::FRAME;
  result.detail = ParseResult::SUCCESS;
  result.bytes_consumed = total;
  result.frame.command = static_cast<CommandId>(input.data[1]);
  result.frame.data.assign(
    input.data + COMMAND_HEADER_SIZE,
    input.data + COMMAND_HEADER_SIZE + data_len);
  return result;
}

CommandFrame makeCommand(CommandId command, std::initializer_list<uint8_t> data)
{
  CommandFrame frame;
  frame.command = command;
  frame.data.assign(data.begin(), data.end());
  return frame;
}

CommandFrame makeQuery(CommandId command)
{
  return makeCommand(command, {REQUEST_DATA});
}

CommandFrame makeIrCommand(IrCode code)
{
  // 24-bit NEC code, MSB first
  const auto raw = static_cast<uint32_t>(code);
  return makeCommand(
    CommandId::SIMULATE_IR,
    {static_cast<uint8_t>((raw >> 16) & 0xFF),
      static_cast<uint8_t>((raw >> 8) & 0xFF),
      static_cast<uint8_t>(raw & 0xFF)});
}

ResponseFrame makeStatus(CommandId command, std::initializer_list<uint8_t> data)
{
  ResponseFrame frame;
  frame.command = command;
  frame.code = ResponseCode::STATUS_UPDATE;
  frame.data.assign(data.begin(), data.end());
  return frame;
}

void FrameDecoder::feed(const uint8_t * data, size_t len)
{
  if (data == nullptr || len == 0) {
    return;
  }
  buf_.insert(buf_.end(), data, data + len);

  if (buf_.size() > MAX_BUFFERED) {
    const size_t excess = buf_.size() - MAX_BUFFERED;
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(excess));
    discarded_bytes_ += excess;
  }
}

bool FrameDecoder::pop(ResponseFrame & out)
{
  while (!buf_.empty()) {
    auto result = decodeResponse(ByteSpan(buf_));
    switch (result.status) {
      case DecodeStatus::NEED_MORE_DATA:
        return false;
      case DecodeStatus::INVALID:
        // A bad header byte at position 0 is noise, not a frame
        if (result.detail != ParseResult::INVALID_START_BYTE) {
          ++invalid_frames_;
        }
        discarded_bytes_ += result.bytes_consumed;
        buf_.erase(
          buf_.begin(),
          buf_.begin() + static_cast<std::ptrdiff_t>(result.bytes_consumed));
        break;
      case DecodeStatus::FRAME:
        out = std::move(result.frame);
        buf_.erase(
          buf_.begin(),
          buf_.begin() + static_cast<std::ptrdiff_t>(result.bytes_consumed));
        return true;
    }
  }
  return false;
}

void FrameDecoder::reset()
{
  buf_.clear();
}

} // namespace protocol
} // namespace jblav
