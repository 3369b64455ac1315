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

#include <filesystem>
#include <string>

#include "utils/test_utils.hpp"
#include "weighlink/common/exceptions.hpp"
#include "weighlink/config/scale_config_loader.hpp"
#include "weighlink/diagnostics/error_handler.hpp"

using namespace weighlink;
using namespace weighlink::config;
using weighlink::test::TestUtils;

class ScaleConfigLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    diagnostics::ErrorHandler::instance().reset_stats();
    file_path_ = TestUtils::makeTempFilePath("weighlink_scale", ".properties");
  }

  void TearDown() override { TestUtils::removeFileIfExists(file_path_); }

  ScaleConfig load(const std::string& content) {
    TestUtils::writeFile(file_path_, content);
    return ScaleConfigLoader::from_file(file_path_.string());
  }

  std::filesystem::path file_path_;
};

TEST_F(ScaleConfigLoaderTest, EmptyFileKeepsDefaults) {
  ScaleConfig cfg = load("# nothing configured\n");
  ScaleConfig defaults;

  EXPECT_EQ(cfg.device, defaults.device);
  EXPECT_EQ(cfg.baud_rate, 9600u);
  EXPECT_EQ(cfg.char_size, 8u);
  EXPECT_EQ(cfg.parity, ScaleConfig::Parity::None);
  EXPECT_EQ(cfg.stop_bits, 1u);
  EXPECT_EQ(cfg.flow, FlowControl{});
  EXPECT_FALSE(cfg.signals.dtr);
  EXPECT_FALSE(cfg.signals.rts);
  EXPECT_EQ(cfg.open_delay_ms, 50u);
  EXPECT_EQ(cfg.close_delay_ms, 50u);
  EXPECT_EQ(cfg.protocol, ProtocolType::Frame);
  EXPECT_EQ(cfg.pattern, "(\\d+)");
  EXPECT_EQ(cfg.read_timeout_ms, 3000u);
  EXPECT_EQ(cfg.log_level, diagnostics::LogLevel::INFO);
}

TEST_F(ScaleConfigLoaderTest, AllKeysAreMapped) {
  ScaleConfig cfg = load(
      "serial.port=/dev/ttyACM0\n"
      "serial.baudRate=19200\n"
      "serial.dataBits=7\n"
      "serial.parity=Even\n"
      "serial.stopBits=2\n"
      "serial.rtscts=true\n"
      "serial.xon=true\n"
      "serial.xoff=true\n"
      "serial.xany=true\n"
      "serial.hupcl=true\n"
      "serial.dtr=true\n"
      "serial.rts=true\n"
      "serial.openDelay=120\n"
      "serial.closeDelay=80\n"
      "protocol.type=LINE\n"
      "regex.filter=[D@F](\\d+)\n"
      "read.timeout=1500\n"
      "log.level=debug\n");

  EXPECT_EQ(cfg.device, "/dev/ttyACM0");
  EXPECT_EQ(cfg.baud_rate, 19200u);
  EXPECT_EQ(cfg.char_size, 7u);
  EXPECT_EQ(cfg.parity, ScaleConfig::Parity::Even);
  EXPECT_EQ(cfg.stop_bits, 2u);
  EXPECT_TRUE(cfg.flow.rtscts);
  EXPECT_TRUE(cfg.flow.xon);
  EXPECT_TRUE(cfg.flow.xoff);
  EXPECT_TRUE(cfg.flow.xany);
  EXPECT_TRUE(cfg.flow.hupcl);
  EXPECT_TRUE(cfg.signals.dtr);
  EXPECT_TRUE(cfg.signals.rts);
  EXPECT_EQ(cfg.open_delay_ms, 120u);
  EXPECT_EQ(cfg.close_delay_ms, 80u);
  EXPECT_EQ(cfg.protocol, ProtocolType::Line);
  EXPECT_EQ(cfg.pattern, "[D@F](\\d+)");
  EXPECT_EQ(cfg.read_timeout_ms, 1500u);
  EXPECT_EQ(cfg.log_level, diagnostics::LogLevel::DEBUG);
}

TEST_F(ScaleConfigLoaderTest, FlagsRequireLiteralTrue) {
  ScaleConfig cfg = load(
      "serial.dtr=TRUE\n"
      "serial.rts=1\n"
      "serial.rtscts=yes\n");
  EXPECT_FALSE(cfg.signals.dtr);
  EXPECT_FALSE(cfg.signals.rts);
  EXPECT_FALSE(cfg.flow.rtscts);
}

TEST_F(ScaleConfigLoaderTest, NumbersUseLeadingInteger) {
  ScaleConfig cfg = load(
      "serial.baudRate=4800 baud\n"
      "read.timeout=250ms\n");
  EXPECT_EQ(cfg.baud_rate, 4800u);
  EXPECT_EQ(cfg.read_timeout_ms, 250u);
}

TEST_F(ScaleConfigLoaderTest, UnparsableOrZeroNumbersFallBack) {
  ScaleConfig cfg = load(
      "serial.baudRate=fast\n"
      "serial.dataBits=0\n"
      "read.timeout=\n");
  EXPECT_EQ(cfg.baud_rate, 9600u);
  EXPECT_EQ(cfg.char_size, 8u);
  EXPECT_EQ(cfg.read_timeout_ms, 3000u);
}

TEST_F(ScaleConfigLoaderTest, ZeroDelaysAreHonoured) {
  ScaleConfig cfg = load(
      "serial.openDelay=0\n"
      "serial.closeDelay=0\n");
  EXPECT_EQ(cfg.open_delay_ms, 0u);
  EXPECT_EQ(cfg.close_delay_ms, 0u);
}

TEST_F(ScaleConfigLoaderTest, PatternKeptVerbatim) {
  ScaleConfig cfg = load("regex.filter=\\r\\n(\\d+)\\r\\n\n");
  EXPECT_EQ(cfg.pattern, "\\r\\n(\\d+)\\r\\n");
}

TEST_F(ScaleConfigLoaderTest, MissingFileThrows) {
  try {
    ScaleConfigLoader::from_file("/nonexistent/scale.properties");
    FAIL() << "Expected ConfigurationException";
  } catch (const common::ConfigurationException& e) {
    EXPECT_NE(std::string(e.what()).find("/nonexistent/scale.properties"), std::string::npos);
    EXPECT_EQ(e.get_config_section(), "file");
  }
  EXPECT_EQ(diagnostics::ErrorHandler::instance().get_error_count(ErrorCode::InvalidConfiguration), 1u);
}

TEST_F(ScaleConfigLoaderTest, InvalidParityThrows) {
  try {
    load("serial.parity=mark\n");
    FAIL() << "Expected ConfigurationException";
  } catch (const common::ConfigurationException& e) {
    EXPECT_EQ(e.get_config_section(), "parity");
  }
}

TEST_F(ScaleConfigLoaderTest, InvalidProtocolThrows) {
  EXPECT_THROW(load("protocol.type=packet\n"), common::ConfigurationException);
}

TEST_F(ScaleConfigLoaderTest, OutOfRangeValuesThrow) {
  EXPECT_THROW(load("serial.dataBits=9\n"), common::ConfigurationException);
  EXPECT_THROW(load("serial.stopBits=3\n"), common::ConfigurationException);
  EXPECT_THROW(load("serial.openDelay=-5\n"), common::ConfigurationException);
  EXPECT_THROW(load("serial.closeDelay=60000\n"), common::ConfigurationException);
  EXPECT_THROW(load("read.timeout=999999999\n"), common::ConfigurationException);
}

TEST_F(ScaleConfigLoaderTest, InvalidDevicePathThrows) {
  EXPECT_THROW(load("serial.port=not a device\n"), common::ConfigurationException);
}

TEST_F(ScaleConfigLoaderTest, WindowsPortNamesAccepted) {
  EXPECT_EQ(load("serial.port=COM7\n").device, "COM7");
}

TEST_F(ScaleConfigLoaderTest, UnknownLogLevelThrows) {
  try {
    load("log.level=verbose\n");
    FAIL() << "Expected ConfigurationException";
  } catch (const common::ConfigurationException& e) {
    EXPECT_EQ(e.get_config_section(), "log.level");
    EXPECT_NE(std::string(e.what()).find("verbose"), std::string::npos);
  }
}

TEST_F(ScaleConfigLoaderTest, WarnAliasAccepted) {
  EXPECT_EQ(load("log.level=WARN\n").log_level, diagnostics::LogLevel::WARNING);
}

TEST(ScaleConfigLoaderManagerTest, BuildsFromInMemoryProperties) {
  ConfigManager properties;
  properties.set("serial.port", std::string("/dev/ttyS1"));
  properties.set("read.timeout", 900);
  properties.set("serial.dtr", true);

  ScaleConfig cfg = ScaleConfigLoader::from_manager(properties);
  EXPECT_EQ(cfg.device, "/dev/ttyS1");
  EXPECT_EQ(cfg.read_timeout_ms, 900u);
  EXPECT_TRUE(cfg.signals.dtr);
}
