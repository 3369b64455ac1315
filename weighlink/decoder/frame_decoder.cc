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

#include "weighlink/decoder/frame_decoder.hpp"

#include <stdexcept>
#include <utility>

#include "weighlink/diagnostics/printable.hpp"

namespace weighlink {
namespace decoder {

using diagnostics::printable;

FrameDecoder::FrameDecoder(std::shared_ptr<const PatternExtractor> extractor, uint8_t start_marker,
                           uint8_t end_marker, size_t max_buffer, diagnostics::SessionLog log)
    : extractor_(std::move(extractor)),
      start_marker_(static_cast<char>(start_marker)),
      end_marker_(static_cast<char>(end_marker)),
      max_buffer_(max_buffer),
      log_(std::move(log)) {
  if (!extractor_) {
    throw std::invalid_argument("FrameDecoder: extractor cannot be null.");
  }
  if (start_marker == end_marker) {
    throw std::invalid_argument("FrameDecoder: start and end markers must differ.");
  }
}

void FrameDecoder::push_bytes(common::ConstByteSpan data) {
  if (data.empty()) return;

  buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());
  WEIGHLINK_SLOG_DEBUG(log_, "decode", "Received: " + printable(common::to_string(data)));

  if (!try_extract()) {
    enforce_limit();
  }
}

bool FrameDecoder::try_extract() {
  size_t start = buffer_.rfind(start_marker_);
  if (start == std::string::npos) return false;

  size_t end = buffer_.find(end_marker_, start + 1);
  WEIGHLINK_SLOG_DEBUG(log_, "decode",
                       "Frame detection: last start at " + std::to_string(start) + ", end " +
                           (end == std::string::npos ? std::string("not found") : "at " + std::to_string(end)) +
                           ", buffer " + std::to_string(buffer_.size()) + " bytes");
  if (end == std::string::npos) return false;

  std::string_view frame(buffer_.data() + start, end - start + 1);
  auto value = extractor_->extract(frame);
  if (!value) {
    WEIGHLINK_SLOG_DEBUG(log_, "decode", "No reading in frame: " + printable(frame));
    return false;
  }

  DecodedReading reading{*value, std::string(frame), false};
  buffer_.erase(0, end + 1);
  WEIGHLINK_SLOG_DEBUG(log_, "decode", "Frame " + printable(reading.raw) + " -> " + std::to_string(reading.value));
  if (on_reading_) on_reading_(reading);
  return true;
}

void FrameDecoder::enforce_limit() {
  if (buffer_.size() <= max_buffer_) return;

  size_t start = buffer_.rfind(start_marker_);
  if (start == std::string::npos) {
    WEIGHLINK_SLOG_DEBUG(log_, "decode", "Buffer over limit without a frame start, clearing");
    buffer_.clear();
  } else {
    WEIGHLINK_SLOG_DEBUG(log_, "decode", "Buffer over limit, keeping data from the last frame start");
    buffer_.erase(0, start);
  }
}

void FrameDecoder::set_on_reading(ReadingCallback cb) { on_reading_ = std::move(cb); }

}  // namespace decoder
}  // namespace weighlink
