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
#include <algorithm>
#include <random>
#include <vector>

using namespace jblav::protocol;

// Test fixture for malformed input handling
class FrameErrorTest : public ::testing::Test
{
protected:
  std::vector<uint8_t> valid_;

  void SetUp() override
  {
    valid_ = encodeResponse(makeStatus(CommandId::VOLUME, {30}));
    ASSERT_EQ(valid_.size(), 7u);
  }

  std::vector<ResponseFrame> drain(FrameDecoder & decoder)
  {
    std::vector<ResponseFrame> out;
    ResponseFrame frame;
    while (decoder.pop(frame)) {
      out.push_back(frame);
    }
    return out;
  }
};

TEST_F(FrameErrorTest, TruncatedFrameNeedsMoreData) {
  for (size_t n = 1; n < valid_.size(); ++n) {
    auto result = decodeResponse(ByteSpan(valid_.data(), n));
    EXPECT_EQ(result.status, DecodeStatus::NEED_MORE_DATA) << "prefix " << n;
    EXPECT_EQ(result.bytes_consumed, 0u);
  }
}

TEST_F(FrameErrorTest, WrongStartByte) {
  valid_[0] = 0x23;
  auto result = decodeResponse(ByteSpan(valid_));
  EXPECT_EQ(result.status, DecodeStatus::INVALID);
  EXPECT_EQ(result.detail, ParseResult::INVALID_START_BYTE);
  // No other 0x02 in the buffer
  EXPECT_EQ(result.bytes_consumed, valid_.size());
}

TEST_F(FrameErrorTest, PrefixWithoutCommandStart) {
  valid_[1] = 0x00;
  auto result = decodeResponse(ByteSpan(valid_));
  EXPECT_EQ(result.status, DecodeStatus::INVALID);
  EXPECT_EQ(result.detail, ParseResult::INVALID_START_BYTE);
}

TEST_F(FrameErrorTest, UnknownResponseCode) {
  valid_[3] = 0x7F;
  auto result = decodeResponse(ByteSpan(valid_));
  EXPECT_EQ(result.status, DecodeStatus::INVALID);
  EXPECT_EQ(result.detail, ParseResult::INVALID_RESPONSE_CODE);
}

TEST_F(FrameErrorTest, LengthAboveLimit) {
  valid_[4] = static_cast<uint8_t>(MAX_DATA_LENGTH + 1);
  auto result = decodeResponse(ByteSpan(valid_));
  EXPECT_EQ(result.status, DecodeStatus::INVALID);
  EXPECT_EQ(result.detail, ParseResult::INVALID_LENGTH);
}

TEST_F(FrameErrorTest, TerminatorNotAtDeclaredLength) {
  valid_[6] = 0x0C;
  auto result = decodeResponse(ByteSpan(valid_));
  EXPECT_EQ(result.status, DecodeStatus::INVALID);
  EXPECT_EQ(result.detail, ParseResult::MISSING_END_BYTE);
}

TEST_F(FrameErrorTest, CommandDecoderRejectsBadTerminator) {
  auto bytes = encodeCommand(makeCommand(CommandId::MUTE, {1}));
  bytes.back() = 0x00;
  auto result = decodeCommand(ByteSpan(bytes));
  EXPECT_EQ(result.status, DecodeStatus::INVALID);
  EXPECT_EQ(result.detail, ParseResult::MISSING_END_BYTE);
}

TEST_F(FrameErrorTest, LeadingNoiseIsSkippedWithoutCounting) {
  FrameDecoder decoder;
  const uint8_t noise[] = {0xFF, 0x00, 0x0D};
  decoder.feed(noise, sizeof(noise));
  decoder.feed(valid_.data(), valid_.size());

  auto frames = drain(decoder);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0], makeStatus(CommandId::VOLUME, {30}));
  EXPECT_EQ(decoder.invalidFrames(), 0u);
  EXPECT_EQ(decoder.discardedBytes(), sizeof(noise));
}

TEST_F(FrameErrorTest, FakeHeaderDoesNotSwallowNextFrame) {
  // A header announcing five data bytes, cut short by a real frame
  std::vector<uint8_t> stream = {0x02, 0x23, 0x06, 0x00, 0x05};
  auto mute = encodeResponse(makeStatus(CommandId::MUTE, {1}));
  stream.insert(stream.end(), mute.begin(), mute.end());

  FrameDecoder decoder;
  decoder.feed(stream.data(), stream.size());
  auto frames = drain(decoder);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0], makeStatus(CommandId::MUTE, {1}));
  EXPECT_EQ(decoder.invalidFrames(), 1u);
}

TEST_F(FrameErrorTest, RandomCorruptionNeverDesyncsForGood) {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<int> byte(0, 255);
  std::uniform_int_distribution<int> junk_len(0, 40);

  // Frames whose bytes contain 0x02 only at the start
  auto frameFor = [](int i) {
      return makeStatus(CommandId::VOLUME, {static_cast<uint8_t>(10 + (i % 80))});
    };

  for (int round = 0; round < 50; ++round) {
    std::vector<uint8_t> stream;
    for (int i = 0; i < 10; ++i) {
      const int n = junk_len(rng);
      for (int j = 0; j < n; ++j) {
        stream.push_back(static_cast<uint8_t>(byte(rng)));
      }
      auto bytes = encodeResponse(frameFor(i));
      stream.insert(stream.end(), bytes.begin(), bytes.end());
    }
    // Clean tail; a stale fake header can span at most 70 bytes of it
    const int tail = 20;
    for (int i = 0; i < tail; ++i) {
      auto bytes = encodeResponse(frameFor(100 + i));
      stream.insert(stream.end(), bytes.begin(), bytes.end());
    }

    FrameDecoder decoder;
    std::vector<ResponseFrame> frames;
    size_t pos = 0;
    std::uniform_int_distribution<int> chunk(1, 16);
    while (pos < stream.size()) {
      const size_t n = std::min(stream.size() - pos, static_cast<size_t>(chunk(rng)));
      decoder.feed(stream.data() + pos, n);
      pos += n;
      auto out = drain(decoder);
      frames.insert(frames.end(), out.begin(), out.end());
    }

    ASSERT_GE(frames.size(), 10u) << "round " << round;
    for (int i = 0; i < 10; ++i) {
      EXPECT_EQ(frames[frames.size() - 10 + i], frameFor(100 + tail - 10 + i))
        << "round " << round;
    }
  }
}

TEST_F(FrameErrorTest, GarbageIsBoundedInMemory) {
  FrameDecoder decoder;
  // An announced 64-byte frame keeps the decoder waiting; feed far more
  std::vector<uint8_t> stall = {0x02, 0x23, 0x06, 0x00, 0x40};
  decoder.feed(stall.data(), stall.size());
  std::vector<uint8_t> filler(FrameDecoder::MAX_BUFFERED * 2, 0x02);
  decoder.feed(filler.data(), filler.size());
  EXPECT_LE(decoder.buffered(), FrameDecoder::MAX_BUFFERED);
}

TEST_F(FrameErrorTest, ResetDropsPartialFrame) {
  FrameDecoder decoder;
  decoder.feed(valid_.data(), 4);
  decoder.reset();
  decoder.feed(valid_.data(), valid_.size());
  auto frames = drain(decoder);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(decoder.buffered(), 0u);
}
