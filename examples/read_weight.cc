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

#include <iostream>
#include <string>

#include "weighlink/diagnostics/printable.hpp"
#include "weighlink/weighlink.hpp"

using namespace weighlink;

namespace {

constexpr size_t kRawPreview = 100;

void print_usage(const char* program) {
  std::cout << "Usage: " << program << " [config-file]\n"
            << "  config-file  properties file with serial.* / protocol.type / regex.filter /\n"
            << "               read.timeout / log.level settings (default: config.properties)\n";
}

std::string preview(const std::string& raw) {
  std::string shown = diagnostics::printable(raw.substr(0, kRawPreview));
  if (raw.size() > kRawPreview) shown += "...";
  return shown;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config.properties";
  if (argc > 1) {
    std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    config_path = arg;
  }

  std::cout << "Loading config from: " << config_path << std::endl;

  try {
    auto reader = WeightReader::from_file(config_path);
    diagnostics::Logger::instance().set_level(reader.config().log_level);

    SessionResult result = reader.read_weight();
    if (!result) {
      std::cerr << "Error: " << to_string(result.failure().code) << ": " << result.failure().reason << std::endl;
      return 1;
    }

    const auto& ok = result.success();
    std::cout << "Weight: " << ok.reading << " kg" << std::endl;
    std::cout << "Protocol: " << config::to_string(ok.protocol) << std::endl;
    std::cout << "Read time: " << ok.elapsed.count() << "ms" << std::endl;
    std::cout << "Raw data: " << preview(ok.raw_data) << std::endl;
  } catch (const common::WeighlinkException& e) {
    std::cerr << "Fatal error: " << e.get_full_message() << std::endl;
    return 1;
  }
  return 0;
}
