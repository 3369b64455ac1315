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

#pragma once

#include <memory>
#include <string>

#include "weighlink/base/visibility.hpp"
#include "weighlink/decoder/idecoder.hpp"
#include "weighlink/decoder/pattern_extractor.hpp"
#include "weighlink/diagnostics/session_log.hpp"

namespace weighlink {
namespace decoder {

/**
 * @brief Decoder for start/end marker framed protocols (STX ... ETX).
 *
 * Only the most recent start marker counts: scales that stream continuously
 * leave truncated frames behind, and the newest frame is the current weight.
 */
class WEIGHLINK_API FrameDecoder : public IDecoder {
 public:
  /**
   * @brief Construct a new Frame Decoder
   *
   * @param extractor Pattern applied to each complete frame
   * @param start_marker Frame start byte
   * @param end_marker Frame end byte
   * @param max_buffer Buffer size above which stale data is discarded
   * @param log Session log for decode diagnostics
   */
  FrameDecoder(std::shared_ptr<const PatternExtractor> extractor, uint8_t start_marker, uint8_t end_marker,
               size_t max_buffer, diagnostics::SessionLog log);

  ~FrameDecoder() override = default;

  void push_bytes(common::ConstByteSpan data) override;
  void set_on_reading(ReadingCallback cb) override;
  size_t buffered() const override { return buffer_.size(); }

 private:
  bool try_extract();
  void enforce_limit();

  std::shared_ptr<const PatternExtractor> extractor_;
  char start_marker_;
  char end_marker_;
  size_t max_buffer_;
  diagnostics::SessionLog log_;

  std::string buffer_;
  ReadingCallback on_reading_;
};

}  // namespace decoder
}  // namespace weighlink
