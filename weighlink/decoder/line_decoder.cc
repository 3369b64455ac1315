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

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>

#include "weighlink/diagnostics/printable.hpp"

namespace weighlink {
namespace decoder {

using diagnostics::printable;

namespace {

bool is_blank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

}  // namespace

LineDecoder::LineDecoder(std::shared_ptr<const PatternExtractor> extractor, uint8_t terminator, size_t max_buffer,
                         bool zero_is_standby, diagnostics::SessionLog log)
    : extractor_(std::move(extractor)),
      terminator_(static_cast<char>(terminator)),
      max_buffer_(max_buffer),
      zero_is_standby_(zero_is_standby),
      log_(std::move(log)) {
  if (!extractor_) {
    throw std::invalid_argument("LineDecoder: extractor cannot be null.");
  }
}

void LineDecoder::push_bytes(common::ConstByteSpan data) {
  if (data.empty()) return;

  buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());
  WEIGHLINK_SLOG_DEBUG(log_, "decode", "Received: " + printable(common::to_string(data)));

  bool has_terminator = std::find(data.begin(), data.end(), static_cast<uint8_t>(terminator_)) != data.end();
  if (has_terminator && scan_lines()) return;

  if (buffer_.size() > max_buffer_) {
    WEIGHLINK_SLOG_DEBUG(log_, "decode", "Buffer over limit without a reading, clearing");
    buffer_.clear();
  }
}

bool LineDecoder::scan_lines() {
  WEIGHLINK_SLOG_DEBUG(log_, "decode", "Complete line detected");

  std::string candidate;
  std::optional<DecodedReading> standby;
  size_t begin = 0;
  while (begin <= buffer_.size()) {
    size_t end = buffer_.find(terminator_, begin);
    if (end == std::string::npos) end = buffer_.size();

    std::string_view line(buffer_.data() + begin, end - begin);
    if (!is_blank(line)) {
      candidate.assign(line.data(), line.size());
      candidate.push_back(terminator_);

      auto value = extractor_->extract(candidate);
      if (value && zero_is_standby_ && *value == 0) {
        WEIGHLINK_SLOG_DEBUG(log_, "decode", "Standby line: " + printable(candidate));
        standby = DecodedReading{0, candidate, true};
      } else if (value) {
        DecodedReading reading{*value, candidate, false};
        WEIGHLINK_SLOG_DEBUG(log_, "decode",
                             "Line " + printable(reading.raw) + " -> " + std::to_string(reading.value));
        if (on_reading_) on_reading_(reading);
        return true;
      } else {
        WEIGHLINK_SLOG_DEBUG(log_, "decode", "No reading in line: " + printable(candidate));
      }
    }
    begin = end + 1;
  }

  if (standby && on_reading_) on_reading_(*standby);
  return false;
}

void LineDecoder::set_on_reading(ReadingCallback cb) { on_reading_ = std::move(cb); }

}  // namespace decoder
}  // namespace weighlink
