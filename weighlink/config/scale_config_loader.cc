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

#include "weighlink/config/scale_config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "weighlink/common/exceptions.hpp"
#include "weighlink/common/input_validator.hpp"
#include "weighlink/common/leading_int.hpp"
#include "weighlink/diagnostics/error_handler.hpp"
#include "weighlink/diagnostics/logger.hpp"

namespace weighlink {
namespace config {

using common::InputValidator;

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
  return value;
}

class PropertyReader {
 public:
  explicit PropertyReader(const ConfigManager& properties) : properties_(properties) {}

  std::string text(const std::string& key, const std::string& fallback) const {
    std::string value = properties_.get_text(key);
    return value.empty() ? fallback : value;
  }

  // A missing, unparsable or zero value falls back to the default
  int64_t number(const std::string& key, int64_t fallback) const {
    auto parsed = common::parse_leading_int(properties_.get_text(key));
    return parsed && *parsed != 0 ? *parsed : fallback;
  }

  // Delays honour an explicit zero, which disables the wait
  int64_t delay(const std::string& key, int64_t fallback) const {
    if (!properties_.has(key)) return fallback;
    auto parsed = common::parse_leading_int(properties_.get_text(key));
    return parsed ? *parsed : fallback;
  }

  bool flag(const std::string& key) const { return properties_.get_text(key) == "true"; }

 private:
  const ConfigManager& properties_;
};

}  // namespace

ScaleConfig ScaleConfigLoader::from_file(const std::string& path) {
  ConfigManager properties;
  if (!properties.load_from_file(path)) {
    diagnostics::error_reporting::report_configuration_error("config", "load", ErrorCode::InvalidConfiguration,
                                                             "Cannot read configuration file: " + path);
    throw common::ConfigurationException("Cannot read configuration file: " + path, "file", "load");
  }
  WEIGHLINK_LOG_INFO("config", "load", "Loaded configuration from " + path);
  return from_manager(properties);
}

ScaleConfig ScaleConfigLoader::from_manager(const ConfigManager& properties) {
  PropertyReader reader(properties);
  ScaleConfig cfg;

  try {
    cfg.device = reader.text("serial.port", cfg.device);
    InputValidator::validate_device_path(cfg.device);

    int64_t baud = reader.number("serial.baudRate", cfg.baud_rate);
    InputValidator::validate_range(baud, static_cast<int64_t>(common::constants::MIN_BAUD_RATE),
                                   static_cast<int64_t>(common::constants::MAX_BAUD_RATE), "serial.baudRate");
    cfg.baud_rate = static_cast<unsigned>(baud);

    int64_t data_bits = reader.number("serial.dataBits", cfg.char_size);
    InputValidator::validate_range(data_bits, static_cast<int64_t>(common::constants::MIN_DATA_BITS),
                                   static_cast<int64_t>(common::constants::MAX_DATA_BITS), "serial.dataBits");
    cfg.char_size = static_cast<unsigned>(data_bits);

    std::string parity = to_lower(reader.text("serial.parity", "none"));
    InputValidator::validate_parity(parity);
    if (parity == "even") {
      cfg.parity = ScaleConfig::Parity::Even;
    } else if (parity == "odd") {
      cfg.parity = ScaleConfig::Parity::Odd;
    } else {
      cfg.parity = ScaleConfig::Parity::None;
    }

    int64_t stop_bits = reader.number("serial.stopBits", cfg.stop_bits);
    InputValidator::validate_range(stop_bits, static_cast<int64_t>(common::constants::MIN_STOP_BITS),
                                   static_cast<int64_t>(common::constants::MAX_STOP_BITS), "serial.stopBits");
    cfg.stop_bits = static_cast<unsigned>(stop_bits);

    cfg.flow.rtscts = reader.flag("serial.rtscts");
    cfg.flow.xon = reader.flag("serial.xon");
    cfg.flow.xoff = reader.flag("serial.xoff");
    cfg.flow.xany = reader.flag("serial.xany");
    cfg.flow.hupcl = reader.flag("serial.hupcl");
    cfg.signals.dtr = reader.flag("serial.dtr");
    cfg.signals.rts = reader.flag("serial.rts");

    int64_t open_delay = reader.delay("serial.openDelay", cfg.open_delay_ms);
    InputValidator::validate_range(open_delay, int64_t{0},
                                   static_cast<int64_t>(common::constants::MAX_STABILIZATION_DELAY_MS),
                                   "serial.openDelay");
    cfg.open_delay_ms = static_cast<unsigned>(open_delay);

    int64_t close_delay = reader.delay("serial.closeDelay", cfg.close_delay_ms);
    InputValidator::validate_range(close_delay, int64_t{0},
                                   static_cast<int64_t>(common::constants::MAX_STABILIZATION_DELAY_MS),
                                   "serial.closeDelay");
    cfg.close_delay_ms = static_cast<unsigned>(close_delay);

    std::string protocol = to_lower(reader.text("protocol.type", "frame"));
    InputValidator::validate_protocol(protocol);
    cfg.protocol = protocol == "line" ? ProtocolType::Line : ProtocolType::Frame;

    cfg.pattern = reader.text("regex.filter", cfg.pattern);

    int64_t timeout = reader.number("read.timeout", cfg.read_timeout_ms);
    InputValidator::validate_range(timeout, static_cast<int64_t>(common::constants::MIN_READ_TIMEOUT_MS),
                                   static_cast<int64_t>(common::constants::MAX_READ_TIMEOUT_MS), "read.timeout");
    cfg.read_timeout_ms = static_cast<unsigned>(timeout);
  } catch (const common::ValidationException& e) {
    diagnostics::error_reporting::report_configuration_error("config", "validate", ErrorCode::InvalidConfiguration,
                                                             e.what());
    throw common::ConfigurationException(e.what(), e.get_parameter(), "validate");
  }

  std::string level = reader.text("log.level", "info");
  try {
    cfg.log_level = diagnostics::parse_log_level(to_lower(level));
  } catch (const std::invalid_argument& e) {
    diagnostics::error_reporting::report_configuration_error("config", "validate", ErrorCode::InvalidConfiguration,
                                                             e.what());
    throw common::ConfigurationException("Unknown log level: " + level, "log.level", "validate");
  }

  return cfg;
}

}  // namespace config
}  // namespace weighlink
