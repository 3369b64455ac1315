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

#include <cstdio>
#include <string>
#include <string_view>

namespace weighlink {
namespace diagnostics {

/**
 * @brief Render scale traffic for log lines
 *
 * STX, ETX, CR and LF become [STX], [ETX], [CR], [LF]; any other byte
 * outside printable ASCII becomes [0xNN].
 */
inline std::string printable(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  for (char ch : data) {
    auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case 0x02:
        out += "[STX]";
        break;
      case 0x03:
        out += "[ETX]";
        break;
      case '\r':
        out += "[CR]";
        break;
      case '\n':
        out += "[LF]";
        break;
      default:
        if (c >= 0x20 && c < 0x7F) {
          out += ch;
        } else {
          char hex[8];
          std::snprintf(hex, sizeof(hex), "[0x%02X]", c);
          out += hex;
        }
    }
  }
  return out;
}

}  // namespace diagnostics
}  // namespace weighlink
