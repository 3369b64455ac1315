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

#include "weighlink/decoder/pattern_extractor.hpp"

#include "weighlink/common/exceptions.hpp"
#include "weighlink/common/leading_int.hpp"

namespace weighlink {
namespace decoder {

namespace {

// Perl syntax; '.' spans line breaks and '^'/'$' match at every line
boost::regex compile(const std::string& pattern) {
  try {
    return boost::regex(pattern, boost::regex::perl | boost::regex::mod_s);
  } catch (const boost::regex_error& e) {
    throw common::PatternException(std::string("invalid extraction pattern: ") + e.what(), pattern);
  }
}

}  // namespace

PatternExtractor::PatternExtractor(const std::string& pattern) : pattern_(pattern), regex_(compile(pattern)) {}

std::optional<int64_t> PatternExtractor::extract(std::string_view candidate) const {
  boost::cmatch match;
  if (!boost::regex_search(candidate.data(), candidate.data() + candidate.size(), match, regex_)) {
    return std::nullopt;
  }

  std::string_view text(match[0].first, static_cast<size_t>(match[0].length()));
  if (has_group() && match[1].matched && match[1].length() > 0) {
    text = std::string_view(match[1].first, static_cast<size_t>(match[1].length()));
  }
  return common::parse_leading_int(text);
}

}  // namespace decoder
}  // namespace weighlink
