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

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "fixtures/fake_serial_port.hpp"
#include "utils/test_utils.hpp"
#include "weighlink/common/exceptions.hpp"
#include "weighlink/weighlink.hpp"

using namespace weighlink;
using namespace weighlink::wrapper;

namespace {

// Builds one fake port per session; each port replays the next scripted payload
class ScriptedPorts {
 public:
  explicit ScriptedPorts(std::vector<std::string> payloads) : payloads_(std::move(payloads)) {}

  WeightReader::PortFactory factory() {
    return [this](boost::asio::io_context& ioc) -> std::unique_ptr<interface::SerialPortInterface> {
      auto journal = std::make_shared<test::FakePortJournal>();
      journals.push_back(journal);
      auto port = std::make_unique<test::FakeSerialPort>(ioc, journal);
      if (next_ < payloads_.size()) port->feed(payloads_[next_++]);
      return port;
    };
  }

  std::vector<std::shared_ptr<test::FakePortJournal>> journals;

 private:
  std::vector<std::string> payloads_;
  size_t next_ = 0;
};

config::ScaleConfig fast_config() {
  config::ScaleConfig cfg;
  cfg.device = "/dev/ttyUSB0";
  cfg.open_delay_ms = 0;
  cfg.close_delay_ms = 0;
  cfg.read_timeout_ms = 50;
  cfg.log_level = diagnostics::LogLevel::CRITICAL;
  return cfg;
}

}  // namespace

TEST(WeightReaderTest, ReturnsReading) {
  ScriptedPorts ports({"\x02" "ST,GS,+0001520kg\x03"});
  auto cfg = fast_config();
  cfg.pattern = "([+-]\\d+)";
  WeightReader reader(cfg, ports.factory());

  auto result = reader.read_weight();
  ASSERT_TRUE(result) << result.describe();
  EXPECT_EQ(result.success().reading, 1520);
  ASSERT_EQ(ports.journals.size(), 1u);
  EXPECT_EQ(ports.journals[0]->close_calls, 1);
}

TEST(WeightReaderTest, EachCallIsIndependent) {
  ScriptedPorts ports({"\x02" "100\x03", "\x02" "200\x03"});
  WeightReader reader(fast_config(), ports.factory());

  auto first = reader.read_weight();
  auto second = reader.read_weight();
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.success().reading, 100);
  EXPECT_EQ(second.success().reading, 200);

  ASSERT_EQ(ports.journals.size(), 2u);
  for (const auto& journal : ports.journals) {
    EXPECT_EQ(journal->open_calls, 1);
    EXPECT_EQ(journal->close_calls, 1);
    EXPECT_TRUE(journal->destroyed);
  }
}

TEST(WeightReaderTest, FailureIsReturnedNotThrown) {
  ScriptedPorts ports(std::vector<std::string>{});
  WeightReader reader(fast_config(), ports.factory());

  session::SessionResult result = reader.read_weight();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.failure().code, ErrorCode::TimedOut);
  EXPECT_NE(result.describe().find("Timed Out"), std::string::npos);
}

TEST(WeightReaderTest, FromFileUsesProperties) {
  auto path = test::TestUtils::makeTempFilePath("weighlink_reader", ".properties");
  test::TestUtils::writeFile(path,
                             "serial.port=/dev/ttyS3\n"
                             "serial.baudRate=4800\n"
                             "protocol.type=line\n"
                             "regex.filter=D(\\d+)\n"
                             "read.timeout=750\n");

  WeightReader reader = WeightReader::from_file(path.string());
  EXPECT_EQ(reader.config().device, "/dev/ttyS3");
  EXPECT_EQ(reader.config().baud_rate, 4800u);
  EXPECT_EQ(reader.config().protocol, config::ProtocolType::Line);
  EXPECT_EQ(reader.config().pattern, "D(\\d+)");
  EXPECT_EQ(reader.config().read_timeout_ms, 750u);

  test::TestUtils::removeFileIfExists(path);
}

TEST(WeightReaderTest, MissingFileThrows) {
  EXPECT_THROW(WeightReader::from_file("/nonexistent/weighlink.properties"), common::ConfigurationException);
  EXPECT_THROW(weighlink::read_weight("/nonexistent/weighlink.properties"), common::ConfigurationException);
}
