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
#include <string>

#include "weighlink/base/platform.hpp"
#include "weighlink/config/scale_config.hpp"

namespace weighlink {
namespace interface {

namespace net = boost::asio;

/**
 * @brief An interface abstracting Boost.Asio's serial_port for testability.
 *
 * Beyond the line parameters Asio exposes, a scale connection needs the
 * individual flow-control flags and the DTR/RTS levels, which Asio's
 * serial_port_base options cannot express.
 */
class SerialPortInterface {
 public:
  virtual ~SerialPortInterface() = default;

  virtual void open(const std::string& device, boost::system::error_code& ec) = 0;
  virtual bool is_open() const = 0;
  virtual void close(boost::system::error_code& ec) = 0;

  virtual void set_option(const net::serial_port_base::baud_rate& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::character_size& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::stop_bits& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::parity& option, boost::system::error_code& ec) = 0;

  /**
   * @brief Apply rtscts/xon/xoff/xany/hupcl exactly as given
   */
  virtual void set_flow_control(const config::FlowControl& flow, boost::system::error_code& ec) = 0;

  /**
   * @brief Drive DTR and RTS to the given levels in one operation and clear BREAK
   */
  virtual void set_modem_signals(const config::ModemSignals& signals, boost::system::error_code& ec) = 0;

  virtual void async_read_some(const net::mutable_buffer& buffer,
                               std::function<void(const boost::system::error_code&, std::size_t)> handler) = 0;
};

}  // namespace interface
}  // namespace weighlink
