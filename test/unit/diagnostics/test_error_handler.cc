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

#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <stdexcept>
#include <string>

#include "weighlink/diagnostics/error_handler.hpp"

using namespace weighlink;
using namespace weighlink::diagnostics;

class ErrorHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& error_handler = ErrorHandler::instance();
    error_handler.reset_stats();
    error_handler.clear_callbacks();
    error_handler.set_enabled(true);
    error_handler.set_min_error_level(ErrorLevel::INFO);
  }

  void TearDown() override {
    auto& error_handler = ErrorHandler::instance();
    error_handler.clear_callbacks();
    error_handler.set_enabled(true);
    error_handler.set_min_error_level(ErrorLevel::INFO);
  }
};

TEST_F(ErrorHandlerTest, ConnectionErrorReporting) {
  auto& error_handler = ErrorHandler::instance();

  error_reporting::report_connection_error("sequencer", "open", ErrorCode::PortUnavailable,
                                           boost::asio::error::no_such_device);

  auto stats = error_handler.get_error_stats();
  EXPECT_EQ(stats.total_errors, 1u);
  EXPECT_EQ(stats.errors_by_level[static_cast<int>(ErrorLevel::ERROR)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<int>(ErrorCategory::CONNECTION)], 1u);

  auto recent = error_handler.get_recent_errors(1);
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_EQ(recent[0].component, "sequencer");
  EXPECT_EQ(recent[0].operation, "open");
  EXPECT_EQ(recent[0].code, ErrorCode::PortUnavailable);
  EXPECT_TRUE(recent[0].boost_error);
}

TEST_F(ErrorHandlerTest, CloseFailureIsAWarning) {
  error_reporting::report_connection_error("sequencer", "close", ErrorCode::CloseFailure,
                                           boost::asio::error::bad_descriptor);
  auto recent = ErrorHandler::instance().get_recent_errors(1);
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_EQ(recent[0].level, ErrorLevel::WARNING);
}

TEST_F(ErrorHandlerTest, SignalWarningReporting) {
  error_reporting::report_signal_warning("sequencer", "open", boost::asio::error::operation_not_supported);

  auto& error_handler = ErrorHandler::instance();
  EXPECT_EQ(error_handler.get_error_count(ErrorCode::SignalSetFailure), 1u);
  EXPECT_EQ(error_handler.get_error_stats().errors_by_level[static_cast<int>(ErrorLevel::WARNING)], 1u);
}

TEST_F(ErrorHandlerTest, CommunicationAndConfigurationCategories) {
  error_reporting::report_communication_error("session", "timeout", ErrorCode::TimedOut, "no reading");
  error_reporting::report_configuration_error("session", "compile", ErrorCode::InvalidPatternConfig, "bad pattern");

  auto stats = ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.errors_by_category[static_cast<int>(ErrorCategory::COMMUNICATION)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<int>(ErrorCategory::CONFIGURATION)], 1u);
  EXPECT_LE(stats.first_error, stats.last_error);
}

TEST_F(ErrorHandlerTest, CallbacksReceiveErrors) {
  auto& error_handler = ErrorHandler::instance();
  std::string summary;
  error_handler.register_callback([&summary](const ErrorInfo& info) { summary = info.get_summary(); });

  error_reporting::report_communication_error("session", "read", ErrorCode::TransportError, "port vanished",
                                              boost::asio::error::eof);

  EXPECT_NE(summary.find("[ERROR] [session] [read] Transport Error: port vanished"), std::string::npos);
  EXPECT_NE(summary.find("(system: "), std::string::npos);
}

TEST_F(ErrorHandlerTest, ThrowingCallbackDoesNotStopOthers) {
  auto& error_handler = ErrorHandler::instance();
  int calls = 0;
  error_handler.register_callback([](const ErrorInfo&) { throw std::runtime_error("callback failed"); });
  error_handler.register_callback([&calls](const ErrorInfo&) { calls++; });

  EXPECT_NO_THROW(error_reporting::report_configuration_error("config", "load", ErrorCode::InvalidConfiguration,
                                                              "missing file"));
  EXPECT_EQ(calls, 1);
}

TEST_F(ErrorHandlerTest, MinimumLevelFilters) {
  auto& error_handler = ErrorHandler::instance();
  error_handler.set_min_error_level(ErrorLevel::ERROR);

  error_reporting::report_signal_warning("sequencer", "close", boost::asio::error::operation_not_supported);
  EXPECT_EQ(error_handler.get_error_stats().total_errors, 0u);

  error_reporting::report_communication_error("session", "timeout", ErrorCode::TimedOut, "no reading");
  EXPECT_EQ(error_handler.get_error_stats().total_errors, 1u);
}

TEST_F(ErrorHandlerTest, DisabledHandlerRecordsNothing) {
  auto& error_handler = ErrorHandler::instance();
  error_handler.set_enabled(false);
  EXPECT_FALSE(error_handler.is_enabled());

  error_reporting::report_communication_error("session", "timeout", ErrorCode::TimedOut, "no reading");
  EXPECT_EQ(error_handler.get_error_stats().total_errors, 0u);
}

TEST_F(ErrorHandlerTest, RecentErrorsAreBounded) {
  auto& error_handler = ErrorHandler::instance();
  for (int i = 0; i < 5; ++i) {
    error_reporting::report_communication_error("session", "timeout", ErrorCode::TimedOut, std::to_string(i));
  }
  auto recent = error_handler.get_recent_errors(3);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent.front().message, "2");
  EXPECT_EQ(recent.back().message, "4");
}

TEST(ErrorCodeTest, SessionFailureCodes) {
  EXPECT_TRUE(is_session_failure(ErrorCode::PortUnavailable));
  EXPECT_TRUE(is_session_failure(ErrorCode::TimedOut));
  EXPECT_TRUE(is_session_failure(ErrorCode::TransportError));
  EXPECT_TRUE(is_session_failure(ErrorCode::InvalidPatternConfig));
  EXPECT_FALSE(is_session_failure(ErrorCode::SignalSetFailure));
  EXPECT_FALSE(is_session_failure(ErrorCode::CloseFailure));
  EXPECT_EQ(to_string(ErrorCode::TimedOut), "Timed Out");
}
