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

#include <cstddef>
#include <cstdint>

namespace weighlink {
namespace common {

namespace constants {

// Line parameter defaults
constexpr unsigned DEFAULT_BAUD_RATE = 9600;
constexpr unsigned DEFAULT_DATA_BITS = 8;
constexpr unsigned DEFAULT_STOP_BITS = 1;

// Validation constants
constexpr size_t MAX_DEVICE_PATH_LENGTH = 256;  // Maximum device path length
constexpr uint32_t MIN_BAUD_RATE = 50;          // Minimum baud rate
constexpr uint32_t MAX_BAUD_RATE = 4000000;     // Maximum baud rate
constexpr uint8_t MIN_DATA_BITS = 5;            // Minimum data bits
constexpr uint8_t MAX_DATA_BITS = 8;            // Maximum data bits
constexpr uint8_t MIN_STOP_BITS = 1;            // Minimum stop bits
constexpr uint8_t MAX_STOP_BITS = 2;            // Maximum stop bits

// Anti-reset timing
constexpr unsigned DEFAULT_OPEN_DELAY_MS = 50;
constexpr unsigned DEFAULT_CLOSE_DELAY_MS = 50;
constexpr unsigned MAX_STABILIZATION_DELAY_MS = 10000;  // 10s maximum

// Read deadline
constexpr unsigned DEFAULT_READ_TIMEOUT_MS = 3000;  // 3 seconds
constexpr unsigned MIN_READ_TIMEOUT_MS = 1;
constexpr unsigned MAX_READ_TIMEOUT_MS = 300000;  // 5 minutes maximum

// Decoding
constexpr size_t DEFAULT_DECODE_BUFFER_LIMIT = 1000;  // bytes kept without a terminator
constexpr size_t MIN_DECODE_BUFFER_LIMIT = 16;
constexpr size_t MAX_DECODE_BUFFER_LIMIT = 1024 * 1024;
constexpr size_t DEFAULT_READ_CHUNK = 256;

constexpr uint8_t STX = 0x02;
constexpr uint8_t ETX = 0x03;
constexpr uint8_t CR = 0x0D;
constexpr uint8_t LF = 0x0A;

constexpr const char* DEFAULT_PATTERN = "(\\d+)";

// Error handling
constexpr size_t DEFAULT_MAX_RECENT_ERRORS = 1000;

}  // namespace constants

}  // namespace common
}  // namespace weighlink
