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
#include <boost/regex.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "weighlink/base/visibility.hpp"

namespace weighlink {
namespace decoder {

/**
 * @brief Pulls an integer reading out of a candidate unit with a regular expression
 *
 * The pattern uses Perl syntax with '.' matching line breaks and '^'/'$'
 * anchoring at each line of the candidate. When it has a capturing group, group 1
 * holds the number; when group 1 did not take part in the match (or matched
 * nothing) the whole match is used instead. The chosen text is read as a
 * leading base-10 integer, so "+0020450kg" gives 20450.
 */
class WEIGHLINK_API PatternExtractor {
 public:
  /**
   * @throws common::PatternException if the pattern does not compile
   */
  explicit PatternExtractor(const std::string& pattern);

  std::optional<int64_t> extract(std::string_view candidate) const;

  const std::string& pattern() const { return pattern_; }
  bool has_group() const { return regex_.mark_count() > 0; }

 private:
  std::string pattern_;
  boost::regex regex_;
};

}  // namespace decoder
}  // namespace weighlink
