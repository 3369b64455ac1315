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

#include "weighlink/base/visibility.hpp"
#include "weighlink/config/config_manager.hpp"
#include "weighlink/config/scale_config.hpp"

namespace weighlink {
namespace config {

/**
 * @brief Builds a ScaleConfig from a properties file
 *
 * Recognised keys:
 *   serial.port, serial.baudRate, serial.dataBits, serial.parity, serial.stopBits,
 *   serial.rtscts, serial.xon, serial.xoff, serial.xany, serial.dtr, serial.rts, serial.hupcl,
 *   serial.openDelay, serial.closeDelay, protocol.type, regex.filter, read.timeout, log.level
 *
 * Absent keys keep the ScaleConfig defaults. Numeric keys are read as a
 * leading integer, so "9600 baud" is 9600. Boolean keys are true only for
 * the literal text "true".
 */
class WEIGHLINK_API ScaleConfigLoader {
 public:
  /**
   * @throws common::ConfigurationException if the file cannot be read or a value is invalid
   */
  static ScaleConfig from_file(const std::string& path);

  /**
   * @throws common::ConfigurationException if a value is invalid
   */
  static ScaleConfig from_manager(const ConfigManager& properties);
};

}  // namespace config
}  // namespace weighlink
