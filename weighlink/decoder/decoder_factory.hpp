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

#include <memory>

#include "weighlink/base/visibility.hpp"
#include "weighlink/config/scale_config.hpp"
#include "weighlink/decoder/idecoder.hpp"
#include "weighlink/decoder/pattern_extractor.hpp"
#include "weighlink/diagnostics/session_log.hpp"

namespace weighlink {
namespace decoder {

/**
 * Decoder Factory
 * - Picks the decoding discipline named by ScaleConfig::protocol
 */
class WEIGHLINK_API DecoderFactory {
 public:
  static std::unique_ptr<IDecoder> create(const config::ScaleConfig& cfg,
                                          std::shared_ptr<const PatternExtractor> extractor,
                                          const diagnostics::SessionLog& log);

 private:
  static std::unique_ptr<IDecoder> create_frame(const config::ScaleConfig& cfg,
                                                std::shared_ptr<const PatternExtractor> extractor,
                                                const diagnostics::SessionLog& log);
  static std::unique_ptr<IDecoder> create_line(const config::ScaleConfig& cfg,
                                               std::shared_ptr<const PatternExtractor> extractor,
                                               const diagnostics::SessionLog& log);
};

}  // namespace decoder
}  // namespace weighlink
