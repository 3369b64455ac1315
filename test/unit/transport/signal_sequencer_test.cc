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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fixtures/fake_serial_port.hpp"
#include "weighlink/diagnostics/error_handler.hpp"

using namespace weighlink;
using namespace weighlink::transport;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace net = boost::asio;

class SignalSequencerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    diagnostics::ErrorHandler::instance().reset_stats();
    cfg_.device = "/dev/ttyUSB0";
    cfg_.open_delay_ms = 0;
    cfg_.close_delay_ms = 0;
    journal_ = std::make_shared<test::FakePortJournal>();
    port_ = std::make_unique<test::FakeSerialPort>(ioc_, journal_);
  }

  SignalSequencer make_sequencer() {
    return SignalSequencer(*port_, cfg_, strand_, diagnostics::SessionLog(diagnostics::LogLevel::ERROR, "sequencer"));
  }

  net::io_context ioc_;
  SignalSequencer::Strand strand_{net::make_strand(ioc_)};
  config::ScaleConfig cfg_;
  std::shared_ptr<test::FakePortJournal> journal_;
  std::unique_ptr<test::FakeSerialPort> port_;
};

TEST_F(SignalSequencerTest, OpenAppliesLineParametersThenFlowThenSignals) {
  auto sequencer = make_sequencer();
  std::optional<boost::system::error_code> result;
  sequencer.open([&](const boost::system::error_code& ec) { result = ec; });
  ioc_.run();

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(*result);
  EXPECT_THAT(journal_->calls,
              ElementsAre("open", "baud_rate", "character_size", "stop_bits", "parity", "flow", "signals"));
  EXPECT_EQ(journal_->device, "/dev/ttyUSB0");
}

TEST_F(SignalSequencerTest, DefaultSignalsAreDeasserted) {
  auto sequencer = make_sequencer();
  sequencer.open([](const boost::system::error_code&) {});
  ioc_.run();

  ASSERT_EQ(journal_->signals.size(), 1u);
  EXPECT_FALSE(journal_->signals[0].dtr);
  EXPECT_FALSE(journal_->signals[0].rts);
  ASSERT_EQ(journal_->flows.size(), 1u);
  EXPECT_EQ(journal_->flows[0], config::FlowControl{});
}

TEST_F(SignalSequencerTest, ConfiguredFlagsArePassedThrough) {
  cfg_.flow.rtscts = true;
  cfg_.flow.hupcl = true;
  cfg_.signals.dtr = true;
  auto sequencer = make_sequencer();
  sequencer.open([](const boost::system::error_code&) {});
  ioc_.run();

  ASSERT_EQ(journal_->flows.size(), 1u);
  EXPECT_TRUE(journal_->flows[0].rtscts);
  EXPECT_TRUE(journal_->flows[0].hupcl);
  EXPECT_FALSE(journal_->flows[0].xon);
  ASSERT_EQ(journal_->signals.size(), 1u);
  EXPECT_TRUE(journal_->signals[0].dtr);
  EXPECT_FALSE(journal_->signals[0].rts);
}

TEST_F(SignalSequencerTest, OpenFailureStopsBeforeConfiguring) {
  port_->open_error = net::error::no_such_device;
  auto sequencer = make_sequencer();
  std::optional<boost::system::error_code> result;
  sequencer.open([&](const boost::system::error_code& ec) { result = ec; });
  ioc_.run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, net::error::no_such_device);
  EXPECT_THAT(journal_->calls, ElementsAre("open"));
  EXPECT_EQ(diagnostics::ErrorHandler::instance().get_error_count(ErrorCode::PortUnavailable), 1u);
}

TEST_F(SignalSequencerTest, LineParameterFailureFailsOpen) {
  port_->option_error = net::error::invalid_argument;
  auto sequencer = make_sequencer();
  std::optional<boost::system::error_code> result;
  sequencer.open([&](const boost::system::error_code& ec) { result = ec; });
  ioc_.run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, net::error::invalid_argument);
  EXPECT_EQ(journal_->count("signals"), 0u);
}

TEST_F(SignalSequencerTest, SignalFailureIsOnlyAWarning) {
  port_->signal_error = net::error::operation_not_supported;
  port_->flow_error = net::error::operation_not_supported;
  auto sequencer = make_sequencer();
  std::optional<boost::system::error_code> result;
  sequencer.open([&](const boost::system::error_code& ec) { result = ec; });
  ioc_.run();

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(*result);
  EXPECT_EQ(diagnostics::ErrorHandler::instance().get_error_count(ErrorCode::SignalSetFailure), 2u);
}

TEST_F(SignalSequencerTest, OpenWaitsForStabilizationDelay) {
  cfg_.open_delay_ms = 30;
  auto sequencer = make_sequencer();
  bool opened = false;
  auto started = std::chrono::steady_clock::now();
  sequencer.open([&](const boost::system::error_code&) { opened = true; });
  ioc_.run();

  EXPECT_TRUE(opened);
  EXPECT_GE(std::chrono::steady_clock::now() - started, 30ms);
}

TEST_F(SignalSequencerTest, CloseReassertsSignalsBeforeClosing) {
  cfg_.signals.rts = true;
  auto sequencer = make_sequencer();
  sequencer.open([](const boost::system::error_code&) {});
  ioc_.run();
  ioc_.restart();

  bool closed = false;
  sequencer.close([&] { closed = true; });
  ioc_.run();

  EXPECT_TRUE(closed);
  ASSERT_EQ(journal_->signals.size(), 2u);
  EXPECT_EQ(journal_->signals[0], journal_->signals[1]);
  EXPECT_TRUE(journal_->signals[1].rts);
  EXPECT_EQ(journal_->calls.back(), "close");
  EXPECT_EQ(journal_->calls[journal_->calls.size() - 2], "signals");
  EXPECT_EQ(journal_->close_calls, 1);
}

TEST_F(SignalSequencerTest, CloseWaitsForStabilizationDelay) {
  cfg_.close_delay_ms = 30;
  auto sequencer = make_sequencer();
  sequencer.open([](const boost::system::error_code&) {});
  ioc_.run();
  ioc_.restart();

  bool closed = false;
  auto started = std::chrono::steady_clock::now();
  sequencer.close([&] { closed = true; });
  EXPECT_EQ(journal_->close_calls, 0);
  ioc_.run();

  EXPECT_TRUE(closed);
  EXPECT_EQ(journal_->close_calls, 1);
  EXPECT_GE(std::chrono::steady_clock::now() - started, 30ms);
}

TEST_F(SignalSequencerTest, ZeroCloseDelayClosesImmediately) {
  auto sequencer = make_sequencer();
  sequencer.open([](const boost::system::error_code&) {});
  ioc_.run();

  bool closed = false;
  sequencer.close([&] { closed = true; });
  EXPECT_TRUE(closed);
  EXPECT_EQ(journal_->close_calls, 1);
}

TEST_F(SignalSequencerTest, CloseOnUnopenedPortSkipsSignals) {
  auto sequencer = make_sequencer();
  bool closed = false;
  sequencer.close([&] { closed = true; });

  EXPECT_TRUE(closed);
  EXPECT_EQ(journal_->count("signals"), 0u);
  EXPECT_EQ(journal_->close_calls, 1);
}

TEST_F(SignalSequencerTest, CloseFailureStillCompletes) {
  auto sequencer = make_sequencer();
  sequencer.open([](const boost::system::error_code&) {});
  ioc_.run();

  port_->close_error = net::error::bad_descriptor;
  bool closed = false;
  sequencer.close([&] { closed = true; });

  EXPECT_TRUE(closed);
  EXPECT_EQ(diagnostics::ErrorHandler::instance().get_error_count(ErrorCode::CloseFailure), 1u);
}
