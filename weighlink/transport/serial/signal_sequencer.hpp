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

#include "weighlink/base/visibility.hpp"
#include "weighlink/config/scale_config.hpp"
#include "weighlink/diagnostics/session_log.hpp"
#include "weighlink/interface/iserial_port.hpp"

namespace weighlink {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Opens and closes a serial port without resetting the device behind it
 *
 * Open: device, line parameters, flow control, then DTR/RTS together, then
 * the open stabilization delay. Close: DTR/RTS re-asserted, the close
 * stabilization delay, then the port is closed.
 *
 * Completion handlers run on the strand given at construction. The port
 * and the sequencer must stay alive until a pending handler has run.
 */
class WEIGHLINK_API SignalSequencer {
 public:
  using OpenHandler = std::function<void(const boost::system::error_code&)>;
  using CloseHandler = std::function<void()>;
  using Strand = net::strand<net::io_context::executor_type>;

  SignalSequencer(interface::SerialPortInterface& port, const config::ScaleConfig& cfg, const Strand& strand,
                  diagnostics::SessionLog log);

  /**
   * @brief Open the port and apply the configured signals
   *
   * The handler receives an error only when the device could not be opened
   * or its line parameters could not be applied. Flow-control and modem
   * signal failures are reported as warnings and do not fail the open.
   */
  void open(OpenHandler handler);

  /**
   * @brief Re-assert signals, wait, close; always completes
   *
   * When the port is not open the signal step and the delay are skipped.
   * A close failure is reported but not passed to the handler.
   */
  void close(CloseHandler handler);

 private:
  bool apply_line_parameters(boost::system::error_code& ec);
  void apply_signals(const char* operation);
  void finish_close(const CloseHandler& handler);
  void after_delay(unsigned delay_ms, std::function<void()> next);

  interface::SerialPortInterface& port_;
  const config::ScaleConfig& cfg_;
  Strand strand_;
  net::steady_timer delay_timer_;
  diagnostics::SessionLog log_;
};

}  // namespace transport
}  // namespace weighlink
