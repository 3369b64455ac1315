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

#include "weighlink/base/error_codes.hpp"
#include "weighlink/base/platform.hpp"
#include "weighlink/base/visibility.hpp"

// Configuration
#include "weighlink/config/config_manager.hpp"
#include "weighlink/config/scale_config.hpp"
#include "weighlink/config/scale_config_loader.hpp"

// Session API
#include "weighlink/session/reading_session.hpp"
#include "weighlink/session/session_result.hpp"
#include "weighlink/wrapper/weight_reader.hpp"

// Error handling and logging system includes
#include "weighlink/common/exceptions.hpp"
#include "weighlink/diagnostics/error_handler.hpp"
#include "weighlink/diagnostics/logger.hpp"

namespace weighlink {

using config::ScaleConfig;
using session::SessionResult;
using wrapper::WeightReader;

/**
 * @brief Read one weight using the settings of a properties file
 *
 * @throws common::ConfigurationException if the file is missing or invalid
 */
inline SessionResult read_weight(const std::string& config_path) {
  return WeightReader::from_file(config_path).read_weight();
}

}  // namespace weighlink
