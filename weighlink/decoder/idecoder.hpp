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

#include <cstdint>
#include <functional>
#include <string>

#include "weighlink/base/visibility.hpp"
#include "weighlink/common/safe_span.hpp"

namespace weighlink {
namespace decoder {

/**
 * @brief A reading taken from one candidate unit
 */
struct DecodedReading {
  int64_t value = 0;
  std::string raw;  // the frame or line the value was extracted from
  bool standby = false;  // idle marker: kept as a fallback, does not end the session
};

/**
 * @brief Abstract base class for weight decoding disciplines.
 *
 * Accumulates the serial byte stream, cuts it into candidate units and runs
 * the pattern extractor on each one.
 */
class WEIGHLINK_API IDecoder {
 public:
  virtual ~IDecoder() = default;

  /**
   * @brief Append a received chunk and attempt extraction.
   *
   * Invokes the reading callback at most once per chunk, with a standby
   * reading only when no regular reading was found.
   *
   * @param data The raw data chunk to process.
   */
  virtual void push_bytes(common::ConstByteSpan data) = 0;

  using ReadingCallback = std::function<void(const DecodedReading&)>;
  virtual void set_on_reading(ReadingCallback cb) = 0;

  /**
   * @brief Number of bytes currently held in the decode buffer.
   */
  virtual size_t buffered() const = 0;
};

}  // namespace decoder
}  // namespace weighlink
