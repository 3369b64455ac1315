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

#include "weighlink/session/reading_session.hpp"

#include "weighlink/common/exceptions.hpp"
#include "weighlink/decoder/decoder_factory.hpp"
#include "weighlink/diagnostics/error_handler.hpp"
#include "weighlink/diagnostics/printable.hpp"
#include "weighlink/transport/serial/boost_serial_port.hpp"

namespace weighlink {
namespace session {

namespace net = boost::asio;

using diagnostics::printable;
namespace error_reporting = diagnostics::error_reporting;

std::shared_ptr<ReadingSession> ReadingSession::create(const config::ScaleConfig& cfg, net::io_context& ioc) {
  return std::shared_ptr<ReadingSession>(
      new ReadingSession(cfg, std::make_unique<transport::BoostSerialPort>(ioc), ioc));
}

std::shared_ptr<ReadingSession> ReadingSession::create(const config::ScaleConfig& cfg,
                                                       std::unique_ptr<interface::SerialPortInterface> port,
                                                       net::io_context& ioc) {
  return std::shared_ptr<ReadingSession>(new ReadingSession(cfg, std::move(port), ioc));
}

ReadingSession::ReadingSession(const config::ScaleConfig& cfg, std::unique_ptr<interface::SerialPortInterface> port,
                               net::io_context& ioc)
    : strand_(ioc.get_executor()),
      cfg_(cfg),
      log_(cfg.log_level, "session"),
      port_(std::move(port)),
      sequencer_(*port_, cfg_, strand_, log_.for_component("sequencer")),
      deadline_(strand_) {
  // Validate and clamp configuration
  cfg_.validate_and_clamp();
  rx_.resize(cfg_.read_chunk);
}

ReadingSession::~ReadingSession() = default;

void ReadingSession::start(CompletionHandler handler) {
  if (started_) {
    WEIGHLINK_SLOG_WARNING(log_, "start", "Session already started, ignoring");
    return;
  }
  started_ = true;
  handler_ = std::move(handler);
  net::post(strand_, [self = shared_from_this()] { self->begin(); });
}

void ReadingSession::begin() {
  started_at_ = std::chrono::steady_clock::now();
  WEIGHLINK_SLOG_INFO(log_, "start",
                      "Reading from " + cfg_.device + " (" + config::to_string(cfg_.protocol) + ", timeout " +
                          std::to_string(cfg_.read_timeout_ms) + " ms)");

  if (!build_decoder()) return;

  set_state(State::Opening);
  sequencer_.open([self = shared_from_this()](const boost::system::error_code& ec) { self->on_opened(ec); });
}

bool ReadingSession::build_decoder() {
  try {
    extractor_ = std::make_shared<decoder::PatternExtractor>(cfg_.pattern);
  } catch (const common::PatternException& e) {
    WEIGHLINK_SLOG_ERROR(log_, "compile", e.what());
    error_reporting::report_configuration_error("session", "compile", ErrorCode::InvalidPatternConfig, e.what());
    resolve(make_failure(ErrorCode::InvalidPatternConfig, e.what()));
    return false;
  }

  try {
    decoder_ = decoder::DecoderFactory::create(cfg_, extractor_, log_);
  } catch (const std::invalid_argument& e) {
    WEIGHLINK_SLOG_ERROR(log_, "configure", e.what());
    error_reporting::report_configuration_error("session", "configure", ErrorCode::InvalidConfiguration, e.what());
    resolve(make_failure(ErrorCode::InvalidConfiguration, e.what()));
    return false;
  }

  decoder_->set_on_reading([this](const decoder::DecodedReading& reading) { emitted_ = reading; });
  return true;
}

void ReadingSession::on_opened(const boost::system::error_code& ec) {
  if (ec) {
    resolve(make_failure(ErrorCode::PortUnavailable, "Cannot open " + cfg_.device + ": " + ec.message()));
    return;
  }

  set_state(State::Collecting);
  deadline_.expires_after(std::chrono::milliseconds(cfg_.read_timeout_ms));
  deadline_.async_wait([self = shared_from_this()](const boost::system::error_code& e) { self->on_deadline(e); });
  start_read();
}

void ReadingSession::start_read() {
  if (read_in_flight_ || outcome_.resolved()) return;
  read_in_flight_ = true;

  auto self = shared_from_this();
  port_->async_read_some(net::buffer(rx_.data(), rx_.size()),
                         net::bind_executor(strand_, [self](const boost::system::error_code& ec, std::size_t n) {
                           self->on_read(ec, n);
                         }));
}

void ReadingSession::on_read(const boost::system::error_code& ec, std::size_t n) {
  read_in_flight_ = false;
  if (outcome_.resolved()) return;

  if (ec) {
    WEIGHLINK_SLOG_ERROR(log_, "read", "Serial port error: " + ec.message());
    error_reporting::report_communication_error("session", "read", ErrorCode::TransportError, ec.message(), ec);
    resolve(make_failure(ErrorCode::TransportError, "Serial port error: " + ec.message()));
    return;
  }

  decoder_->push_bytes(common::ConstByteSpan(rx_.data(), n));
  if (emitted_) {
    last_valid_ = std::move(emitted_);
    emitted_.reset();
    if (!last_valid_->standby) {
      WEIGHLINK_SLOG_INFO(log_, "decode", "Weight extracted: " + std::to_string(last_valid_->value));
      // Both disciplines resolve on the first reading
      resolve(make_success(*last_valid_));
      return;
    }
    WEIGHLINK_SLOG_DEBUG(log_, "decode", "Standby reading kept as fallback");
  }

  start_read();
}

void ReadingSession::on_deadline(const boost::system::error_code& ec) {
  if (ec == net::error::operation_aborted || outcome_.resolved()) return;

  if (last_valid_) {
    WEIGHLINK_SLOG_INFO(log_, "timeout",
                        "Timeout reached, using last valid reading: " + std::to_string(last_valid_->value));
    resolve(make_success(*last_valid_));
    return;
  }

  std::string reason =
      "no valid reading within configured timeout (" + std::to_string(cfg_.read_timeout_ms) + " ms)";
  WEIGHLINK_SLOG_WARNING(log_, "timeout", reason);
  error_reporting::report_communication_error("session", "timeout", ErrorCode::TimedOut, reason);
  resolve(make_failure(ErrorCode::TimedOut, reason));
}

void ReadingSession::resolve(SessionResult result) {
  if (!outcome_.offer(std::move(result))) return;

  const SessionResult& outcome = outcome_.get();
  if (outcome.succeeded()) {
    set_state(State::Succeeded);
    WEIGHLINK_SLOG_DEBUG(log_, "resolve", "Raw data: " + printable(outcome.success().raw_data));
  } else {
    set_state(outcome.failure().code == ErrorCode::TimedOut ? State::TimedOut : State::Failed);
  }
  WEIGHLINK_SLOG_INFO(log_, "resolve", "Session resolved: " + outcome.describe());

  deadline_.cancel();
  begin_closing();
}

void ReadingSession::begin_closing() {
  if (closing_) return;
  closing_ = true;

  set_state(State::Closing);
  sequencer_.close([self = shared_from_this()] { self->finish(); });
}

void ReadingSession::finish() {
  set_state(State::Done);
  auto handler = std::move(handler_);
  handler_ = nullptr;
  if (handler) handler(outcome_.get());
}

SessionSuccess ReadingSession::make_success(const decoder::DecodedReading& reading) const {
  return SessionSuccess{reading.value, cfg_.protocol, reading.raw, elapsed()};
}

SessionFailure ReadingSession::make_failure(ErrorCode code, std::string reason) const {
  return SessionFailure{code, std::move(reason), elapsed()};
}

std::chrono::milliseconds ReadingSession::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
}

void ReadingSession::set_state(State state) {
  State previous = state_.exchange(state);
  WEIGHLINK_SLOG_DEBUG(log_, "state", std::string(to_string(previous)) + " -> " + to_string(state));
}

const char* to_string(ReadingSession::State state) {
  switch (state) {
    case ReadingSession::State::Idle:
      return "Idle";
    case ReadingSession::State::Opening:
      return "Opening";
    case ReadingSession::State::Collecting:
      return "Collecting";
    case ReadingSession::State::Succeeded:
      return "Succeeded";
    case ReadingSession::State::TimedOut:
      return "TimedOut";
    case ReadingSession::State::Failed:
      return "Failed";
    case ReadingSession::State::Closing:
      return "Closing";
    case ReadingSession::State::Done:
      return "Done";
  }
  return "Unknown";
}

}  // namespace session
}  // namespace weighlink
