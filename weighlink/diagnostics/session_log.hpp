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

#include <string>
#include <string_view>

#include "weighlink/diagnostics/logger.hpp"

namespace weighlink {
namespace diagnostics {

/**
 * @brief Per-session view over a Logger
 *
 * Carries the verbosity chosen for one reading session together with a
 * component name, so that the decoders, the signal sequencer and the
 * session itself all log at the session's level without touching the
 * process-wide Logger level. Cheap to copy; the Logger must outlive it.
 */
class SessionLog {
 public:
  SessionLog(Logger& sink, LogLevel verbosity, std::string component)
      : sink_(&sink), verbosity_(verbosity), component_(std::move(component)) {}

  explicit SessionLog(LogLevel verbosity = LogLevel::INFO, std::string component = "session")
      : SessionLog(Logger::instance(), verbosity, std::move(component)) {}

  /**
   * @brief Same sink and verbosity, different component name
   */
  SessionLog for_component(std::string component) const { return SessionLog(*sink_, verbosity_, std::move(component)); }

  bool enabled(LogLevel level) const { return level >= verbosity_; }
  LogLevel verbosity() const { return verbosity_; }
  const std::string& component() const { return component_; }

  void write(LogLevel level, std::string_view operation, std::string_view message) const {
    if (enabled(level)) {
      sink_->emit(level, component_, operation, message);
    }
  }

 private:
  Logger* sink_;
  LogLevel verbosity_;
  std::string component_;
};

/**
 * @brief Session logging macros (message is only built when the level is enabled)
 */
#define WEIGHLINK_SLOG_DEBUG(slog, operation, message)                               \
  do {                                                                               \
    if ((slog).enabled(weighlink::diagnostics::LogLevel::DEBUG)) {                   \
      (slog).write(weighlink::diagnostics::LogLevel::DEBUG, operation, message);     \
    }                                                                                \
  } while (0)

#define WEIGHLINK_SLOG_INFO(slog, operation, message)                                \
  do {                                                                               \
    if ((slog).enabled(weighlink::diagnostics::LogLevel::INFO)) {                    \
      (slog).write(weighlink::diagnostics::LogLevel::INFO, operation, message);      \
    }                                                                                \
  } while (0)

#define WEIGHLINK_SLOG_WARNING(slog, operation, message)                             \
  do {                                                                               \
    if ((slog).enabled(weighlink::diagnostics::LogLevel::WARNING)) {                 \
      (slog).write(weighlink::diagnostics::LogLevel::WARNING, operation, message);   \
    }                                                                                \
  } while (0)

#define WEIGHLINK_SLOG_ERROR(slog, operation, message)                               \
  do {                                                                               \
    if ((slog).enabled(weighlink::diagnostics::LogLevel::ERROR)) {                   \
      (slog).write(weighlink::diagnostics::LogLevel::ERROR, operation, message);     \
    }                                                                                \
  } while (0)

}  // namespace diagnostics
}  // namespace weighlink
