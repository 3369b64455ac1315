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

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace weighlink {
namespace common {

/**
 * @brief Parse the base-10 integer at the start of a string
 *
 * Leading whitespace and one optional sign are accepted; parsing stops at
 * the first non-digit. "  -0042kg" yields -42, "kg42" and "" yield nothing,
 * as does a digit run that does not fit in int64_t.
 */
inline std::optional<int64_t> parse_leading_int(std::string_view text) {
  size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }

  const size_t digits_begin = i;
  uint64_t magnitude = 0;
  const uint64_t limit =
      negative ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1 : std::numeric_limits<int64_t>::max();
  for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i) {
    uint64_t digit = static_cast<uint64_t>(text[i] - '0');
    if (magnitude > (limit - digit) / 10) return std::nullopt;
    magnitude = magnitude * 10 + digit;
  }
  if (i == digits_begin) return std::nullopt;

  if (negative) {
    return magnitude == limit ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(magnitude);
  }
  return static_cast<int64_t>(magnitude);
}

}  // namespace common
}  // namespace weighlink
