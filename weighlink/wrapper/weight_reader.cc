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

#include "weighlink/wrapper/weight_reader.hpp"

#include <optional>

#include "weighlink/config/scale_config_loader.hpp"
#include "weighlink/diagnostics/logger.hpp"
#include "weighlink/session/reading_session.hpp"
#include "weighlink/transport/serial/boost_serial_port.hpp"

namespace weighlink {
namespace wrapper {

WeightReader::WeightReader(const config::ScaleConfig& cfg)
    : WeightReader(cfg, [](net::io_context& ioc) -> std::unique_ptr<interface::SerialPortInterface> {
        return std::make_unique<transport::BoostSerialPort>(ioc);
      }) {}

WeightReader::WeightReader(const config::ScaleConfig& cfg, PortFactory port_factory)
    : cfg_(cfg), port_factory_(std::move(port_factory)) {}

WeightReader WeightReader::from_file(const std::string& path) {
  return WeightReader(config::ScaleConfigLoader::from_file(path));
}

session::SessionResult WeightReader::read_weight() {
  net::io_context ioc;
  auto reading = session::ReadingSession::create(cfg_, port_factory_(ioc), ioc);

  std::optional<session::SessionResult> result;
  reading->start([&result](const session::SessionResult& r) { result = r; });
  ioc.run();

  if (!result) {
    WEIGHLINK_LOG_ERROR("reader", "read", "Session stopped without a result");
    return session::SessionFailure{ErrorCode::Unknown, "session stopped without a result", {}};
  }
  return *result;
}

}  // namespace wrapper
}  // namespace weighlink
