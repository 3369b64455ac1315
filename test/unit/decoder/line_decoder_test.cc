/*
 * Copyright 2025 Jinwoo Sung
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

#include "weighlink/decoder/line_decoder.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "weighlink/common/constants.hpp"
#include "weighlink/decoder/decoder_factory.hpp"

using namespace weighlink;
using namespace weighlink::decoder;

class LineDecoderTest : public ::testing::Test {
 protected:
  void SetUp() override { make_decoder("[D@F](\\d+)", 1000, true); }

  void make_decoder(const std::string& pattern, size_t max_buffer, bool zero_is_standby) {
    decoder_ = std::make_unique<LineDecoder>(std::make_shared<const PatternExtractor>(pattern),
                                             common::constants::CR, max_buffer, zero_is_standby,
                                             diagnostics::SessionLog(diagnostics::LogLevel::ERROR, "line"));
    decoder_->set_on_reading([this](const DecodedReading& reading) { readings_.push_back(reading); });
  }

  void push(const std::string& data) { decoder_->push_bytes(common::as_bytes(data)); }

  std::unique_ptr<LineDecoder> decoder_;
  std::vector<DecodedReading> readings_;
};

TEST_F(LineDecoderTest, WeightLineWinsOverIdleLine) {
  push("F000000\r");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_TRUE(readings_[0].standby);
  EXPECT_EQ(readings_[0].value, 0);

  push("D002260\r");
  ASSERT_EQ(readings_.size(), 2u);
  EXPECT_FALSE(readings_[1].standby);
  EXPECT_EQ(readings_[1].value, 2260);
  EXPECT_EQ(readings_[1].raw, "D002260\r");
}

TEST_F(LineDecoderTest, SingleChunkWithBothLines) {
  push("F000000\rD002260\r");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_EQ(readings_[0].value, 2260);
}

TEST_F(LineDecoderTest, NoTerminatorNoScan) {
  push("D0022");
  EXPECT_TRUE(readings_.empty());
  push("60\r");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_EQ(readings_[0].value, 2260);
}

TEST_F(LineDecoderTest, FirstMatchingLineWins) {
  push("D000100\rD000200\r");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_EQ(readings_[0].value, 100);
}

TEST_F(LineDecoderTest, TrailingPartialLineIsTried) {
  make_decoder("W(\\d+)", 1000, true);
  push("junk\rW12");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_EQ(readings_[0].value, 12);
  EXPECT_EQ(readings_[0].raw, "W12\r");
}

TEST_F(LineDecoderTest, BlankLinesAreSkipped) {
  push("\r  \r\r");
  EXPECT_TRUE(readings_.empty());
}

TEST_F(LineDecoderTest, ZeroIsAReadingWhenStandbyDisabled) {
  make_decoder("[D@F](\\d+)", 1000, false);
  push("F000000\r");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_FALSE(readings_[0].standby);
  EXPECT_EQ(readings_[0].value, 0);
}

TEST_F(LineDecoderTest, OverLimitWithoutReadingClears) {
  make_decoder("W(\\d+)", 16, true);
  push(std::string(20, 'x') + "\r");
  EXPECT_TRUE(readings_.empty());
  EXPECT_EQ(decoder_->buffered(), 0u);

  push("W77\r");
  ASSERT_EQ(readings_.size(), 1u);
  EXPECT_EQ(readings_[0].value, 77);
}

TEST_F(LineDecoderTest, BufferIsNotConsumedByScan) {
  push("D000321\r");
  EXPECT_EQ(decoder_->buffered(), 8u);
}

TEST(DecoderFactoryTest, PicksDisciplineFromProtocol) {
  config::ScaleConfig cfg;
  auto extractor = std::make_shared<const PatternExtractor>("(\\d+)");
  diagnostics::SessionLog log(diagnostics::LogLevel::ERROR);

  cfg.protocol = config::ProtocolType::Line;
  auto line = DecoderFactory::create(cfg, extractor, log);
  EXPECT_NE(dynamic_cast<LineDecoder*>(line.get()), nullptr);

  cfg.protocol = config::ProtocolType::Frame;
  auto frame = DecoderFactory::create(cfg, extractor, log);
  EXPECT_EQ(dynamic_cast<LineDecoder*>(frame.get()), nullptr);
  ASSERT_NE(frame, nullptr);
}
