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

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include "weighlink/base/error_codes.hpp"
#include "weighlink/config/scale_config.hpp"

namespace weighlink {
namespace session {

struct SessionSuccess {
  int64_t reading = 0;
  config::ProtocolType protocol = config::ProtocolType::Frame;
  std::string raw_data;  // the frame or line the reading came from
  std::chrono::milliseconds elapsed{0};
};

struct SessionFailure {
  ErrorCode code = ErrorCode::Unknown;
  std::string reason;
  std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Terminal outcome of one reading session, immutable once built
 */
class SessionResult {
 public:
  SessionResult(SessionSuccess success) : outcome_(std::move(success)) {}
  SessionResult(SessionFailure failure) : outcome_(std::move(failure)) {}

  bool succeeded() const { return std::holds_alternative<SessionSuccess>(outcome_); }
  explicit operator bool() const { return succeeded(); }

  /**
   * @throws std::bad_variant_access if the session failed
   */
  const SessionSuccess& success() const { return std::get<SessionSuccess>(outcome_); }

  /**
   * @throws std::bad_variant_access if the session succeeded
   */
  const SessionFailure& failure() const { return std::get<SessionFailure>(outcome_); }

  std::chrono::milliseconds elapsed() const {
    return succeeded() ? success().elapsed : failure().elapsed;
  }

  std::string describe() const {
    if (succeeded()) {
      return "reading " + std::to_string(success().reading) + " (" + config::to_string(success().protocol) + ", " +
             std::to_string(success().elapsed.count()) + " ms)";
    }
    return to_string(failure().code) + ": " + failure().reason + " (" + std::to_string(failure().elapsed.count()) +
           " ms)";
  }

 private:
  std::variant<SessionSuccess, SessionFailure> outcome_;
};

}  // namespace session
}  // namespace weighlink
