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

#include <gtest/gtest.h>
#include "jblav_utils/protocol/frame.hpp"
#include "jblav_utils/errors.hpp"
#include <vector>

using namespace jblav::protocol;

TEST(FrameRoundtrip, VolumeCommandWireBytes) {
  auto bytes = encodeCommand(makeCommand(CommandId::VOLUME, {30}));
  std::vector<uint8_t> expected = {0x23, 0x06, 0x01, 0x1E, 0x0D};
  EXPECT_EQ(bytes, expected);
}

TEST(FrameRoundtrip, HeartbeatHasNoOperand) {
  auto bytes = encodeCommand(makeCommand(CommandId::HEARTBEAT));
  std::vector<uint8_t> expected = {0x23, 0x51, 0x00, 0x0D};
  EXPECT_EQ(bytes, expected);
}

TEST(FrameRoundtrip, QueryCarriesRequestByte) {
  CommandFrame query = makeQuery(CommandId::POWER);
  EXPECT_TRUE(query.isQuery());
  std::vector<uint8_t> expected = {0x23, 0x00, 0x01, 0xF0, 0x0D};
  EXPECT_EQ(encodeCommand(query), expected);
}

TEST(FrameRoundtrip, IrCodeIsSentMsbFirst) {
  CommandFrame ir = makeIrCommand(IrCode::MENU);
  std::vector<uint8_t> expected = {0x23, 0x04, 0x03, 0x01, 0x0E, 0xCA, 0x0D};
  EXPECT_EQ(encodeCommand(ir), expected);
}

TEST(FrameRoundtrip, CommandSurvivesDecode) {
  const CommandFrame frames[] = {
    makeCommand(CommandId::POWER, {1}),
    makeCommand(CommandId::TREBLE_EQ, {0}),
    makeCommand(CommandId::REBOOT),
    makeQuery(CommandId::STREAMING_STATE),
    makeIrCommand(IrCode::VOL_UP),
  };
  for (const auto & frame : frames) {
    auto bytes = encodeCommand(frame);
    auto result = decodeCommand(ByteSpan(bytes));
    ASSERT_EQ(result.status, DecodeStatus::FRAME) << commandName(frame.command);
    EXPECT_EQ(result.bytes_consumed, bytes.size());
    EXPECT_EQ(result.frame, frame);
  }
}

TEST(FrameRoundtrip, StatusResponseWireBytes) {
  auto bytes = encodeResponse(makeStatus(CommandId::VOLUME, {30}));
  std::vector<uint8_t> expected = {0x02, 0x23, 0x06, 0x00, 0x01, 0x1E, 0x0D};
  EXPECT_EQ(bytes, expected);

  auto result = decodeResponse(ByteSpan(bytes));
  ASSERT_EQ(result.status, DecodeStatus::FRAME);
  EXPECT_EQ(result.frame.command, CommandId::VOLUME);
  EXPECT_TRUE(result.frame.isStatus());
  ASSERT_EQ(result.frame.data.size(), 1u);
  EXPECT_EQ(result.frame.data[0], 30);
}

TEST(FrameRoundtrip, ErrorResponseKeepsCode) {
  ResponseFrame frame;
  frame.command = CommandId::INPUT_SOURCE;
  frame.code = ResponseCode::PARAMETER_NOT_RECOGNIZED;
  auto bytes = encodeResponse(frame);
  auto result = decodeResponse(ByteSpan(bytes));
  ASSERT_EQ(result.status, DecodeStatus::FRAME);
  EXPECT_FALSE(result.frame.isStatus());
  EXPECT_TRUE(isErrorResponse(result.frame.code));
  EXPECT_EQ(result.frame, frame);
}

TEST(FrameRoundtrip, VersionResponseWithSeveralBytes) {
  auto bytes = encodeResponse(makeStatus(CommandId::VERSION, {1, 7}));
  auto result = decodeResponse(ByteSpan(bytes));
  ASSERT_EQ(result.status, DecodeStatus::FRAME);
  EXPECT_EQ(result.frame.data, (std::vector<uint8_t>{1, 7}));
}

TEST(FrameRoundtrip, OperandTooLongIsRejected) {
  CommandFrame frame = makeCommand(CommandId::VOLUME, {1, 2});
  EXPECT_THROW(encodeCommand(frame), jblav::EncodingError);

  CommandFrame heartbeat = makeCommand(CommandId::HEARTBEAT, {0});
  EXPECT_THROW(encodeCommand(heartbeat), jblav::EncodingError);
}

TEST(FrameRoundtrip, ResponseDataAtLimit) {
  ResponseFrame frame;
  frame.command = CommandId::VERSION;
  frame.data.assign(MAX_DATA_LENGTH, 0x11);
  auto bytes = encodeResponse(frame);
  auto result = decodeResponse(ByteSpan(bytes));
  ASSERT_EQ(result.status, DecodeStatus::FRAME);
  EXPECT_EQ(result.frame.data.size(), MAX_DATA_LENGTH);

  frame.data.push_back(0x11);
  EXPECT_THROW(encodeResponse(frame), jblav::EncodingError);
}

TEST(FrameRoundtrip, DecoderHandlesByteByByteDelivery) {
  auto a = encodeResponse(makeStatus(CommandId::MUTE, {1}));
  auto b = encodeResponse(makeStatus(CommandId::POWER, {0}));
  std::vector<uint8_t> stream(a);
  stream.insert(stream.end(), b.begin(), b.end());

  FrameDecoder decoder;
  std::vector<ResponseFrame> frames;
  ResponseFrame frame;
  for (uint8_t byte : stream) {
    decoder.feed(&byte, 1);
    while (decoder.pop(frame)) {
      frames.push_back(frame);
    }
  }
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0], makeStatus(CommandId::MUTE, {1}));
  EXPECT_EQ(frames[1], makeStatus(CommandId::POWER, {0}));
  EXPECT_EQ(decoder.buffered(), 0u);
  EXPECT_EQ(decoder.invalidFrames(), 0u);
}
