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
 * @brief Decoder for terminator separated protocols (one reading per line).
 *
 * Whenever a chunk carries the terminator, the whole accumulated buffer is
 * split again and every non-blank line is tried in order, the first reading
 * wins. Nothing ahead of a match is discarded.
 *
 * Line devices interleave idle lines with weight lines (F000000 / D002260).
 * With zero_is_standby set, a line reading 0 is reported as a standby
 * reading only if no other line in the buffer carries a weight.
 */
class WEIGHLINK_API LineDecoder : public IDecoder {
 public:
  /**
   * @brief Construct a new Line Decoder
   *
   * @param extractor Pattern applied to each line (terminator included)
   * @param terminator Line terminator byte
   * @param max_buffer Buffer size above which the buffer is cleared
   * @param zero_is_standby Treat a zero reading as an idle line
   * @param log Session log for decode diagnostics
   */
  LineDecoder(std::shared_ptr<const PatternExtractor> extractor, uint8_t terminator, size_t max_buffer,
              bool zero_is_standby, diagnostics::SessionLog log);

  ~LineDecoder() override = default;

  void push_bytes(common::ConstByteSpan data) override;
  void set_on_reading(ReadingCallback cb) override;
  size_t buffered() const override { return buffer_.size(); }

 private:
  bool scan_lines();

  std::shared_ptr<const PatternExtractor> extractor_;
  char terminator_;
  size_t max_buffer_;
  bool zero_is_standby_;
  diagnostics::SessionLog log_;

  std::string buffer_;
  ReadingCallback on_reading_;
};

}  // namespace decoder
}  // namespace weighlink
