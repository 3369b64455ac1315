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

#include <cstdint>
#include <string>

#include "weighlink/common/constants.hpp"
#include "weighlink/diagnostics/logger.hpp"

namespace weighlink {
namespace config {

/**
 * @brief Flow control flags, applied exactly as given when the port opens
 */
struct FlowControl {
  bool rtscts = false;  // hardware (RTS/CTS) handshake
  bool xon = false;     // honour XON/XOFF on output
  bool xoff = false;    // send XON/XOFF on input
  bool xany = false;    // any byte restarts output
  bool hupcl = false;   // drop modem lines on last close

  bool operator==(const FlowControl& other) const {
    return rtscts == other.rtscts && xon == other.xon && xoff == other.xoff && xany == other.xany &&
           hupcl == other.hupcl;
  }
};

/**
 * @brief Modem control line levels (true = asserted)
 *
 * Both default to deasserted, which is what keeps Arduino-style and
 * similar scale heads from resetting when the port opens.
 */
struct ModemSignals {
  bool dtr = false;
  bool rts = false;

  bool operator==(const ModemSignals& other) const { return dtr == other.dtr && rts == other.rts; }
};

enum class ProtocolType { Frame, Line };

inline const char* to_string(ProtocolType protocol) { return protocol == ProtocolType::Frame ? "frame" : "line"; }

/**
 * @brief Connection configuration for one reading session
 */
struct ScaleConfig {
#ifdef _WIN32
  std::string device = "COM3";
#else
  std::string device = "/dev/ttyUSB0";
#endif
  unsigned baud_rate = common::constants::DEFAULT_BAUD_RATE;
  unsigned char_size = common::constants::DEFAULT_DATA_BITS;  // 5,6,7,8
  enum class Parity { None, Even, Odd } parity = Parity::None;
  unsigned stop_bits = common::constants::DEFAULT_STOP_BITS;  // 1 or 2

  FlowControl flow;
  ModemSignals signals;

  unsigned open_delay_ms = common::constants::DEFAULT_OPEN_DELAY_MS;
  unsigned close_delay_ms = common::constants::DEFAULT_CLOSE_DELAY_MS;

  ProtocolType protocol = ProtocolType::Frame;
  std::string pattern = common::constants::DEFAULT_PATTERN;
  unsigned read_timeout_ms = common::constants::DEFAULT_READ_TIMEOUT_MS;

  uint8_t frame_start = common::constants::STX;
  uint8_t frame_end = common::constants::ETX;
  uint8_t line_terminator = common::constants::CR;
  size_t buffer_limit = common::constants::DEFAULT_DECODE_BUFFER_LIMIT;
  size_t read_chunk = common::constants::DEFAULT_READ_CHUNK;
  // Line mode: a zero reading is an idle line, not a weight. A real zero (empty
  // weighbridge) is then only reported when read_timeout_ms expires.
  bool line_zero_is_standby = true;

  diagnostics::LogLevel log_level = diagnostics::LogLevel::INFO;

  bool is_valid() const {
    return !device.empty() && baud_rate > 0 && char_size >= 5 && char_size <= 8 && (stop_bits == 1 || stop_bits == 2) &&
           read_timeout_ms >= common::constants::MIN_READ_TIMEOUT_MS &&
           read_timeout_ms <= common::constants::MAX_READ_TIMEOUT_MS &&
           open_delay_ms <= common::constants::MAX_STABILIZATION_DELAY_MS &&
           close_delay_ms <= common::constants::MAX_STABILIZATION_DELAY_MS &&
           buffer_limit >= common::constants::MIN_DECODE_BUFFER_LIMIT &&
           buffer_limit <= common::constants::MAX_DECODE_BUFFER_LIMIT && read_chunk > 0 &&
           frame_start != frame_end;
  }

  // Apply validation and clamp values to valid ranges
  void validate_and_clamp() {
    if (char_size < 5)
      char_size = 5;
    else if (char_size > 8)
      char_size = 8;

    if (stop_bits != 1 && stop_bits != 2) stop_bits = 1;

    if (read_timeout_ms < common::constants::MIN_READ_TIMEOUT_MS) {
      read_timeout_ms = common::constants::MIN_READ_TIMEOUT_MS;
    } else if (read_timeout_ms > common::constants::MAX_READ_TIMEOUT_MS) {
      read_timeout_ms = common::constants::MAX_READ_TIMEOUT_MS;
    }

    if (open_delay_ms > common::constants::MAX_STABILIZATION_DELAY_MS) {
      open_delay_ms = common::constants::MAX_STABILIZATION_DELAY_MS;
    }
    if (close_delay_ms > common::constants::MAX_STABILIZATION_DELAY_MS) {
      close_delay_ms = common::constants::MAX_STABILIZATION_DELAY_MS;
    }

    if (buffer_limit < common::constants::MIN_DECODE_BUFFER_LIMIT) {
      buffer_limit = common::constants::MIN_DECODE_BUFFER_LIMIT;
    } else if (buffer_limit > common::constants::MAX_DECODE_BUFFER_LIMIT) {
      buffer_limit = common::constants::MAX_DECODE_BUFFER_LIMIT;
    }

    if (read_chunk == 0) read_chunk = common::constants::DEFAULT_READ_CHUNK;
  }
};

}  // namespace config
}  // namespace weighlink
