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

#include <stdexcept>
#include <string>

namespace weighlink {
namespace common {

/**
 * @brief Base exception class for all weighlink exceptions
 *
 * Carries the component and operation that raised it, in the same shape
 * the logger uses for its records.
 */
class WeighlinkException : public std::runtime_error {
 public:
  explicit WeighlinkException(const std::string& message, const std::string& component = "",
                              const std::string& operation = "")
      : std::runtime_error(message), component_(component), operation_(operation) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
};

/**
 * @brief Exception thrown during input validation
 *
 * Indicates that input parameters failed validation checks.
 */
class ValidationException : public WeighlinkException {
 public:
  explicit ValidationException(const std::string& message, const std::string& parameter = "",
                               const std::string& expected = "")
      : WeighlinkException(message, "validation", "validate"), parameter_(parameter), expected_(expected) {}

  const std::string& get_parameter() const noexcept { return parameter_; }
  const std::string& get_expected() const noexcept { return expected_; }

  std::string get_full_message() const {
    std::string full_msg = WeighlinkException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    if (!expected_.empty()) {
      full_msg += " (expected: " + expected_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
  std::string expected_;
};

/**
 * @brief Exception thrown during configuration loading or mapping
 */
class ConfigurationException : public WeighlinkException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_section = "",
                                  const std::string& operation = "")
      : WeighlinkException(message, "configuration", operation), config_section_(config_section) {}

  const std::string& get_config_section() const noexcept { return config_section_; }

  std::string get_full_message() const {
    std::string full_msg = WeighlinkException::get_full_message();
    if (!config_section_.empty()) {
      full_msg += " (section: " + config_section_ + ")";
    }
    return full_msg;
  }

 private:
  std::string config_section_;
};

/**
 * @brief Exception thrown when the extraction pattern cannot be compiled
 */
class PatternException : public WeighlinkException {
 public:
  PatternException(const std::string& message, const std::string& pattern)
      : WeighlinkException(message, "pattern", "compile"), pattern_(pattern) {}

  const std::string& get_pattern() const noexcept { return pattern_; }

 private:
  std::string pattern_;
};

}  // namespace common
}  // namespace weighlink
