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

#include "weighlink/common/input_validator.hpp"

#include <algorithm>
#include <cctype>

namespace weighlink {
namespace common {

namespace {
std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool is_com_port(const std::string& name) {
  if (name.length() < 4 || name.substr(0, 3) != "COM") return false;
  std::string port_num = name.substr(3);
  if (!std::all_of(port_num.begin(), port_num.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  try {
    int port = std::stoi(port_num);
    return port >= 1 && port <= 255;
  } catch (const std::exception&) {
    return false;
  }
}
}  // namespace

void InputValidator::validate_device_path(const std::string& device) {
  validate_non_empty_string(device, "device_path");
  validate_string_length(device, constants::MAX_DEVICE_PATH_LENGTH, "device_path");

  if (!is_valid_device_path(device)) {
    throw ValidationException("invalid device path format", "device_path", "valid device path");
  }
}

void InputValidator::validate_parity(const std::string& parity) {
  validate_non_empty_string(parity, "parity");

  std::string lower_parity = to_lower(parity);
  if (lower_parity != "none" && lower_parity != "odd" && lower_parity != "even") {
    throw ValidationException("invalid parity value", "parity", "none, odd, or even");
  }
}

void InputValidator::validate_protocol(const std::string& protocol) {
  validate_non_empty_string(protocol, "protocol");

  std::string lower_protocol = to_lower(protocol);
  if (lower_protocol != "frame" && lower_protocol != "line") {
    throw ValidationException("invalid protocol type", "protocol", "frame or line");
  }
}

bool InputValidator::is_valid_device_path(const std::string& device) {
  // Unix-style device path (e.g., /dev/ttyUSB0, /dev/pts/3, /dev/tty.usbserial-1410)
  if (device.length() >= 5 && device.substr(0, 5) == "/dev/") {
    for (char c : device) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '/' && c != '_' && c != '-' && c != '.') {
        return false;
      }
    }
    return true;
  }

  // Windows-style COM port (COM1 .. COM255), optionally in the \\.\COM10 form
  if (is_com_port(device)) return true;
  if (device.length() > 4 && device.substr(0, 4) == "\\\\.\\") {
    return is_com_port(device.substr(4));
  }

  return false;
}

}  // namespace common
}  // namespace weighlink
