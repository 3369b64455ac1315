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

#include "weighlink/transport/serial/signal_sequencer.hpp"

#include <chrono>
#include <string>

#include "weighlink/diagnostics/error_handler.hpp"

namespace weighlink {
namespace transport {

namespace {

std::string levels(const config::ModemSignals& signals) {
  return std::string("DTR=") + (signals.dtr ? "on" : "off") + " RTS=" + (signals.rts ? "on" : "off");
}

}  // namespace

SignalSequencer::SignalSequencer(interface::SerialPortInterface& port, const config::ScaleConfig& cfg,
                                 const Strand& strand, diagnostics::SessionLog log)
    : port_(port), cfg_(cfg), strand_(strand), delay_timer_(strand), log_(std::move(log)) {}

void SignalSequencer::open(OpenHandler handler) {
  boost::system::error_code ec;
  port_.open(cfg_.device, ec);
  if (ec) {
    WEIGHLINK_SLOG_ERROR(log_, "open", "Failed to open device: " + cfg_.device + " - " + ec.message());
    diagnostics::error_reporting::report_connection_error("sequencer", "open", ErrorCode::PortUnavailable, ec);
    net::post(strand_, [handler = std::move(handler), ec] { handler(ec); });
    return;
  }

  if (!apply_line_parameters(ec)) {
    diagnostics::error_reporting::report_connection_error("sequencer", "configure", ErrorCode::PortUnavailable, ec);
    net::post(strand_, [handler = std::move(handler), ec] { handler(ec); });
    return;
  }

  port_.set_flow_control(cfg_.flow, ec);
  if (ec) {
    WEIGHLINK_SLOG_WARNING(log_, "flow_control", "Failed to apply flow control - " + ec.message());
    diagnostics::error_reporting::report_signal_warning("sequencer", "flow_control", ec);
  }

  apply_signals("open");

  WEIGHLINK_SLOG_INFO(log_, "open",
                      "Device opened: " + cfg_.device + " @ " + std::to_string(cfg_.baud_rate) + " (" +
                          levels(cfg_.signals) + ")");
  after_delay(cfg_.open_delay_ms, [handler = std::move(handler)] { handler({}); });
}

void SignalSequencer::close(CloseHandler handler) {
  if (!port_.is_open()) {
    WEIGHLINK_SLOG_DEBUG(log_, "close", "Port not open, closing without signal sequence");
    finish_close(handler);
    return;
  }

  apply_signals("close");
  if (cfg_.close_delay_ms == 0) {
    finish_close(handler);
    return;
  }
  after_delay(cfg_.close_delay_ms, [this, handler = std::move(handler)] { finish_close(handler); });
}

bool SignalSequencer::apply_line_parameters(boost::system::error_code& ec) {
  port_.set_option(net::serial_port_base::baud_rate(cfg_.baud_rate), ec);
  if (ec) {
    WEIGHLINK_SLOG_ERROR(log_, "configure",
                         "Failed to set baud rate: " + std::to_string(cfg_.baud_rate) + " - " + ec.message());
    return false;
  }

  port_.set_option(net::serial_port_base::character_size(cfg_.char_size), ec);
  if (ec) {
    WEIGHLINK_SLOG_ERROR(log_, "configure",
                         "Failed to set character size: " + std::to_string(cfg_.char_size) + " - " + ec.message());
    return false;
  }

  using sb = net::serial_port_base::stop_bits;
  port_.set_option(sb(cfg_.stop_bits == 2 ? sb::two : sb::one), ec);
  if (ec) {
    WEIGHLINK_SLOG_ERROR(log_, "configure",
                         "Failed to set stop bits: " + std::to_string(cfg_.stop_bits) + " - " + ec.message());
    return false;
  }

  using pa = net::serial_port_base::parity;
  pa::type p = pa::none;
  if (cfg_.parity == config::ScaleConfig::Parity::Even)
    p = pa::even;
  else if (cfg_.parity == config::ScaleConfig::Parity::Odd)
    p = pa::odd;
  port_.set_option(pa(p), ec);
  if (ec) {
    WEIGHLINK_SLOG_ERROR(log_, "configure", "Failed to set parity - " + ec.message());
    return false;
  }

  return true;
}

void SignalSequencer::apply_signals(const char* operation) {
  boost::system::error_code ec;
  port_.set_modem_signals(cfg_.signals, ec);
  if (ec) {
    WEIGHLINK_SLOG_WARNING(log_, operation, "Failed to set " + levels(cfg_.signals) + " - " + ec.message());
    diagnostics::error_reporting::report_signal_warning("sequencer", operation, ec);
    return;
  }
  WEIGHLINK_SLOG_DEBUG(log_, operation, "Signals set: " + levels(cfg_.signals));
}

void SignalSequencer::finish_close(const CloseHandler& handler) {
  boost::system::error_code ec;
  port_.close(ec);
  if (ec) {
    WEIGHLINK_SLOG_WARNING(log_, "close", "Failed to close device: " + cfg_.device + " - " + ec.message());
    diagnostics::error_reporting::report_connection_error("sequencer", "close", ErrorCode::CloseFailure, ec);
  } else {
    WEIGHLINK_SLOG_DEBUG(log_, "close", "Device closed: " + cfg_.device);
  }
  handler();
}

void SignalSequencer::after_delay(unsigned delay_ms, std::function<void()> next) {
  if (delay_ms == 0) {
    net::post(strand_, std::move(next));
    return;
  }
  delay_timer_.expires_after(std::chrono::milliseconds(delay_ms));
  delay_timer_.async_wait([next = std::move(next)](const boost::system::error_code&) { next(); });
}

}  // namespace transport
}  // namespace weighlink
