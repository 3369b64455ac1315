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

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <sstream>
#include <string>

#include "weighlink/base/error_codes.hpp"

namespace weighlink {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational message (normal operation info)
  WARNING = 1,  // Warning (recoverable issue)
  ERROR = 2,    // Error (session failed)
  CRITICAL = 3  // Critical error (unrecoverable)
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  CONNECTION = 0,     // Port open/close and modem signals
  COMMUNICATION = 1,  // Data receive and deadline
  CONFIGURATION = 2,  // Invalid config values or pattern
  SYSTEM = 3,         // OS level errors
  UNKNOWN = 4
};

/**
 * @brief Error information reported to the ErrorHandler
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  ErrorCode code;
  std::string component;                            // serial, sequencer, session, config
  std::string operation;                            // open, signals, read, close, compile
  std::string message;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;

  ErrorInfo(ErrorLevel l, ErrorCategory c, ErrorCode ec_code, const std::string& comp, const std::string& op,
            const std::string& msg, const boost::system::error_code& ec = {})
      : level(l),
        category(c),
        code(ec_code),
        component(comp),
        operation(op),
        message(msg),
        boost_error(ec),
        timestamp(std::chrono::system_clock::now()) {}

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  /**
   * @brief Get formatted error summary
   */
  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] " << "[" << component << "] " << "[" << operation << "] "
        << to_string(code) << ": " << message;

    if (boost_error) {
      oss << " (system: " << boost_error.message() << ", code: " << boost_error.value() << ")";
    }
    return oss.str();
  }
};

/**
 * @brief Error statistics for monitoring
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[4] = {0, 0, 0, 0};        // INFO, WARNING, ERROR, CRITICAL
  size_t errors_by_category[5] = {0, 0, 0, 0, 0};  // CONNECTION, COMMUNICATION, ...

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }
};

}  // namespace diagnostics
}  // namespace weighlink
