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

#include "weighlink/decoder/decoder_factory.hpp"

#include "weighlink/decoder/frame_decoder.hpp"
#include "weighlink/decoder/line_decoder.hpp"

namespace weighlink {
namespace decoder {

std::unique_ptr<IDecoder> DecoderFactory::create(const config::ScaleConfig& cfg,
                                                 std::shared_ptr<const PatternExtractor> extractor,
                                                 const diagnostics::SessionLog& log) {
  switch (cfg.protocol) {
    case config::ProtocolType::Line:
      return create_line(cfg, std::move(extractor), log);
    case config::ProtocolType::Frame:
      break;
  }
  return create_frame(cfg, std::move(extractor), log);
}

std::unique_ptr<IDecoder> DecoderFactory::create_frame(const config::ScaleConfig& cfg,
                                                       std::shared_ptr<const PatternExtractor> extractor,
                                                       const diagnostics::SessionLog& log) {
  return std::make_unique<FrameDecoder>(std::move(extractor), cfg.frame_start, cfg.frame_end, cfg.buffer_limit,
                                        log.for_component("frame"));
}

std::unique_ptr<IDecoder> DecoderFactory::create_line(const config::ScaleConfig& cfg,
                                                      std::shared_ptr<const PatternExtractor> extractor,
                                                      const diagnostics::SessionLog& log) {
  return std::make_unique<LineDecoder>(std::move(extractor), cfg.line_terminator, cfg.buffer_limit,
                                       cfg.line_zero_is_standby, log.for_component("line"));
}

}  // namespace decoder
}  // namespace weighlink
