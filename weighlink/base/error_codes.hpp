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

namespace weighlink {

/**
 * @brief Structured error codes for a reading session
 *
 * Only PortUnavailable, TimedOut, TransportError and InvalidPatternConfig
 * ever reach the caller as a failed SessionResult. The others are reported
 * through the logger and the error handler.
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,

  // Session outcomes
  PortUnavailable,
  TimedOut,
  TransportError,
  InvalidPatternConfig,

  // Internal, never surfaced as a result
  SignalSetFailure,
  PatternMismatch,
  CloseFailure
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::PortUnavailable:
      return "Port Unavailable";
    case ErrorCode::TimedOut:
      return "Timed Out";
    case ErrorCode::TransportError:
      return "Transport Error";
    case ErrorCode::InvalidPatternConfig:
      return "Invalid Pattern";
    case ErrorCode::SignalSetFailure:
      return "Signal Set Failure";
    case ErrorCode::PatternMismatch:
      return "Pattern Mismatch";
    case ErrorCode::CloseFailure:
      return "Close Failure";
    default:
      return "Unknown Error Code";
  }
}

/**
 * @brief Whether a code is allowed to terminate a session as a failure
 */
inline bool is_session_failure(ErrorCode code) {
  return code == ErrorCode::PortUnavailable || code == ErrorCode::TimedOut || code == ErrorCode::TransportError ||
         code == ErrorCode::InvalidPatternConfig;
}

}  // namespace weighlink
