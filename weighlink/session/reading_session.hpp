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

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "weighlink/base/visibility.hpp"
#include "weighlink/config/scale_config.hpp"
#include "weighlink/decoder/idecoder.hpp"
#include "weighlink/decoder/pattern_extractor.hpp"
#include "weighlink/diagnostics/session_log.hpp"
#include "weighlink/interface/iserial_port.hpp"
#include "weighlink/session/outcome_slot.hpp"
#include "weighlink/session/session_result.hpp"
#include "weighlink/transport/serial/signal_sequencer.hpp"

namespace weighlink {
namespace session {

namespace net = boost::asio;

/**
 * @brief One open -> collect -> close cycle against a scale
 *
 * The first reading or the read deadline resolves the session, whichever
 * comes first. On the deadline the last reading seen is used if there is
 * one. The port is closed through the signal sequencer on every path and
 * the completion handler is called exactly once, after closing.
 *
 * All handlers run on one strand of the given io_context.
 */
class WEIGHLINK_API ReadingSession : public std::enable_shared_from_this<ReadingSession> {
 public:
  enum class State { Idle, Opening, Collecting, Succeeded, TimedOut, Failed, Closing, Done };
  using CompletionHandler = std::function<void(const SessionResult&)>;

  static std::shared_ptr<ReadingSession> create(const config::ScaleConfig& cfg, net::io_context& ioc);
  // For testing with dependency injection
  static std::shared_ptr<ReadingSession> create(const config::ScaleConfig& cfg,
                                                std::unique_ptr<interface::SerialPortInterface> port,
                                                net::io_context& ioc);

  ~ReadingSession();

  /**
   * @brief Start the session; the handler runs once on the io_context
   *
   * A session runs once. Later calls are ignored.
   */
  void start(CompletionHandler handler);

  State state() const { return state_.load(); }

 private:
  ReadingSession(const config::ScaleConfig& cfg, std::unique_ptr<interface::SerialPortInterface> port,
                 net::io_context& ioc);

  void begin();
  bool build_decoder();
  void on_opened(const boost::system::error_code& ec);
  void start_read();
  void on_read(const boost::system::error_code& ec, std::size_t n);
  void on_deadline(const boost::system::error_code& ec);
  void resolve(SessionResult result);
  void begin_closing();
  void finish();

  SessionSuccess make_success(const decoder::DecodedReading& reading) const;
  SessionFailure make_failure(ErrorCode code, std::string reason) const;
  std::chrono::milliseconds elapsed() const;
  void set_state(State state);

  net::strand<net::io_context::executor_type> strand_;
  config::ScaleConfig cfg_;
  diagnostics::SessionLog log_;
  std::unique_ptr<interface::SerialPortInterface> port_;
  transport::SignalSequencer sequencer_;
  net::steady_timer deadline_;

  std::shared_ptr<const decoder::PatternExtractor> extractor_;
  std::unique_ptr<decoder::IDecoder> decoder_;
  std::vector<uint8_t> rx_;
  bool read_in_flight_ = false;
  std::optional<decoder::DecodedReading> emitted_;
  std::optional<decoder::DecodedReading> last_valid_;

  OutcomeSlot<SessionResult> outcome_;
  CompletionHandler handler_;
  std::chrono::steady_clock::time_point started_at_;
  bool started_ = false;
  bool closing_ = false;
  std::atomic<State> state_{State::Idle};
};

const char* to_string(ReadingSession::State state);

}  // namespace session
}  // namespace weighlink
