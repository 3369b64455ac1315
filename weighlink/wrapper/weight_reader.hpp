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

#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>

#include "weighlink/base/visibility.hpp"
#include "weighlink/config/scale_config.hpp"
#include "weighlink/interface/iserial_port.hpp"
#include "weighlink/session/session_result.hpp"

namespace weighlink {
namespace wrapper {

namespace net = boost::asio;

/**
 * @brief Blocking front end: one call, one reading session
 *
 * Every read_weight() call runs an independent session on its own
 * io_context and returns once the port has been closed again.
 */
class WEIGHLINK_API WeightReader {
 public:
  using PortFactory = std::function<std::unique_ptr<interface::SerialPortInterface>(net::io_context&)>;

  explicit WeightReader(const config::ScaleConfig& cfg);
  // For testing with dependency injection
  WeightReader(const config::ScaleConfig& cfg, PortFactory port_factory);

  /**
   * @throws common::ConfigurationException if the file is missing or holds invalid values
   */
  static WeightReader from_file(const std::string& path);

  session::SessionResult read_weight();

  const config::ScaleConfig& config() const { return cfg_; }

 private:
  config::ScaleConfig cfg_;
  PortFactory port_factory_;
};

}  // namespace wrapper
}  // namespace weighlink
