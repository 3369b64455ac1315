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

#include "weighlink/diagnostics/error_handler.hpp"

#include <algorithm>

#include "weighlink/common/constants.hpp"
#include "weighlink/diagnostics/logger.hpp"

namespace weighlink {
namespace diagnostics {

ErrorHandler::ErrorHandler() = default;
ErrorHandler::~ErrorHandler() = default;

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance;
  return instance;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load()) {
    return;
  }

  if (error.level < min_level_.load()) {
    return;
  }

  std::vector<ErrorCallback> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    update_stats(error);
    add_to_recent_errors(error);
    callbacks_copy = callbacks_;
  }
  notify_callbacks(callbacks_copy, error);
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.reset();
  recent_errors_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);

  size_t start_index = 0;
  if (recent_errors_.size() > count) {
    start_index = recent_errors_.size() - count;
  }

  return std::vector<ErrorInfo>(recent_errors_.begin() + static_cast<std::ptrdiff_t>(start_index),
                                recent_errors_.end());
}

size_t ErrorHandler::get_error_count(ErrorCode code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(recent_errors_.begin(), recent_errors_.end(),
                                           [code](const ErrorInfo& error) { return error.code == code; }));
}

void ErrorHandler::update_stats(const ErrorInfo& error) {
  stats_.total_errors++;
  stats_.errors_by_level[static_cast<int>(error.level)]++;
  stats_.errors_by_category[static_cast<int>(error.category)]++;

  if (stats_.first_error == std::chrono::system_clock::time_point{}) {
    stats_.first_error = error.timestamp;
  }
  stats_.last_error = error.timestamp;
}

void ErrorHandler::add_to_recent_errors(const ErrorInfo& error) {
  recent_errors_.push_back(error);

  if (recent_errors_.size() > common::constants::DEFAULT_MAX_RECENT_ERRORS) {
    recent_errors_.erase(recent_errors_.begin(),
                         recent_errors_.begin() + static_cast<std::ptrdiff_t>(
                                                      recent_errors_.size() - common::constants::DEFAULT_MAX_RECENT_ERRORS));
  }
}

void ErrorHandler::notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error) {
  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Use the Logger directly, reporting here would recurse
      WEIGHLINK_LOG_ERROR("error_handler", "callback", "Error in error callback: " + std::string(e.what()));
    }
  }
}

namespace error_reporting {

void report_connection_error(const std::string& component, const std::string& operation, ErrorCode code,
                             const boost::system::error_code& ec) {
  ErrorLevel level = code == ErrorCode::CloseFailure ? ErrorLevel::WARNING : ErrorLevel::ERROR;
  ErrorInfo error(level, ErrorCategory::CONNECTION, code, component, operation, ec.message(), ec);
  ErrorHandler::instance().report_error(error);
}

void report_signal_warning(const std::string& component, const std::string& operation,
                           const boost::system::error_code& ec) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::CONNECTION, ErrorCode::SignalSetFailure, component, operation,
                  ec.message(), ec);
  ErrorHandler::instance().report_error(error);
}

void report_communication_error(const std::string& component, const std::string& operation, ErrorCode code,
                                const std::string& message, const boost::system::error_code& ec) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::COMMUNICATION, code, component, operation, message, ec);
  ErrorHandler::instance().report_error(error);
}

void report_configuration_error(const std::string& component, const std::string& operation, ErrorCode code,
                                const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, code, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace weighlink
