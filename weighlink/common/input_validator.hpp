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
#include <string>

#include "weighlink/base/visibility.hpp"
#include "weighlink/common/constants.hpp"
#include "weighlink/common/exceptions.hpp"

namespace weighlink {
namespace common {

/**
 * @brief Input validation utility class
 *
 * Throws ValidationException for invalid inputs with detailed error messages.
 */
class WEIGHLINK_API InputValidator {
 public:
  // Serial validation
  static void validate_device_path(const std::string& device);
  static void validate_baud_rate(uint32_t baud_rate);
  static void validate_data_bits(uint8_t data_bits);
  static void validate_stop_bits(uint8_t stop_bits);
  static void validate_parity(const std::string& parity);

  // Timing validation
  static void validate_stabilization_delay(unsigned delay_ms, const std::string& field_name);
  static void validate_read_timeout(unsigned timeout_ms);

  // Decoding validation
  static void validate_protocol(const std::string& protocol);
  static void validate_buffer_limit(size_t limit);

  // String validation
  static void validate_non_empty_string(const std::string& str, const std::string& field_name);
  static void validate_string_length(const std::string& str, size_t max_length, const std::string& field_name);

  // Numeric validation
  static void validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name);
  static void validate_range(size_t value, size_t min, size_t max, const std::string& field_name);

 private:
  static bool is_valid_device_path(const std::string& device);
};

// Inline implementations for simple validations
inline void InputValidator::validate_non_empty_string(const std::string& str, const std::string& field_name) {
  if (str.empty()) {
    throw ValidationException(field_name + " cannot be empty", field_name, "non-empty string");
  }
}

inline void InputValidator::validate_string_length(const std::string& str, size_t max_length,
                                                   const std::string& field_name) {
  if (str.length() > max_length) {
    throw ValidationException(field_name + " length exceeds maximum allowed length", field_name,
                              "length <= " + std::to_string(max_length));
  }
}

inline void InputValidator::validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name) {
  if (value < min || value > max) {
    throw ValidationException(field_name + " out of range", field_name,
                              std::to_string(min) + " <= value <= " + std::to_string(max));
  }
}

inline void InputValidator::validate_range(size_t value, size_t min, size_t max, const std::string& field_name) {
  if (value < min || value > max) {
    throw ValidationException(field_name + " out of range", field_name,
                              std::to_string(min) + " <= value <= " + std::to_string(max));
  }
}

inline void InputValidator::validate_baud_rate(uint32_t baud_rate) {
  validate_range(static_cast<int64_t>(baud_rate), static_cast<int64_t>(constants::MIN_BAUD_RATE),
                 static_cast<int64_t>(constants::MAX_BAUD_RATE), "baud_rate");
}

inline void InputValidator::validate_data_bits(uint8_t data_bits) {
  validate_range(static_cast<int64_t>(data_bits), static_cast<int64_t>(constants::MIN_DATA_BITS),
                 static_cast<int64_t>(constants::MAX_DATA_BITS), "data_bits");
}

inline void InputValidator::validate_stop_bits(uint8_t stop_bits) {
  validate_range(static_cast<int64_t>(stop_bits), static_cast<int64_t>(constants::MIN_STOP_BITS),
                 static_cast<int64_t>(constants::MAX_STOP_BITS), "stop_bits");
}

inline void InputValidator::validate_stabilization_delay(unsigned delay_ms, const std::string& field_name) {
  validate_range(static_cast<int64_t>(delay_ms), int64_t{0},
                 static_cast<int64_t>(constants::MAX_STABILIZATION_DELAY_MS), field_name);
}

inline void InputValidator::validate_read_timeout(unsigned timeout_ms) {
  validate_range(static_cast<int64_t>(timeout_ms), static_cast<int64_t>(constants::MIN_READ_TIMEOUT_MS),
                 static_cast<int64_t>(constants::MAX_READ_TIMEOUT_MS), "read_timeout_ms");
}

inline void InputValidator::validate_buffer_limit(size_t limit) {
  validate_range(limit, constants::MIN_DECODE_BUFFER_LIMIT, constants::MAX_DECODE_BUFFER_LIMIT, "buffer_limit");
}

}  // namespace common
}  // namespace weighlink
