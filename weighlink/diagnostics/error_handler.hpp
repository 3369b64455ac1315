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

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "weighlink/base/visibility.hpp"
#include "weighlink/diagnostics/error_types.hpp"

namespace weighlink {
namespace diagnostics {

/**
 * @brief Centralized error handling system
 *
 * Provides thread-safe error reporting, statistics collection,
 * and callback-based error handling for the whole library.
 */
class WEIGHLINK_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  /**
   * @brief Get singleton instance
   */
  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  void report_error(const ErrorInfo& error);

  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Minimum level (errors below this level are ignored)
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;
  void reset_stats();

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  /**
   * @brief Count recorded errors carrying a given code
   */
  size_t get_error_count(ErrorCode code) const;

 private:
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;

  void update_stats(const ErrorInfo& error);
  void add_to_recent_errors(const ErrorInfo& error);
  void notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error);
};

/**
 * @brief Convenience functions for the reporting scenarios of a reading session
 */
namespace error_reporting {

/**
 * @brief Report a port open/close failure
 * @param code PortUnavailable or CloseFailure
 */
WEIGHLINK_API void report_connection_error(const std::string& component, const std::string& operation, ErrorCode code,
                                           const boost::system::error_code& ec);

/**
 * @brief Report a failure to apply modem signals or flow control (non-fatal)
 */
WEIGHLINK_API void report_signal_warning(const std::string& component, const std::string& operation,
                                         const boost::system::error_code& ec);

/**
 * @brief Report a receive-side failure (TransportError, TimedOut)
 */
WEIGHLINK_API void report_communication_error(const std::string& component, const std::string& operation,
                                              ErrorCode code, const std::string& message,
                                              const boost::system::error_code& ec = {});

/**
 * @brief Report configuration error (InvalidConfiguration, InvalidPatternConfig)
 */
WEIGHLINK_API void report_configuration_error(const std::string& component, const std::string& operation,
                                              ErrorCode code, const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace weighlink
