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
#include <optional>
#include <stdexcept>
#include <utility>

namespace weighlink {
namespace session {

/**
 * @brief Single-assignment slot; the first offer wins, later offers are rejected
 */
template <typename T>
class OutcomeSlot {
 public:
  OutcomeSlot() = default;
  OutcomeSlot(const OutcomeSlot&) = delete;
  OutcomeSlot& operator=(const OutcomeSlot&) = delete;

  /**
   * @return true if this offer filled the slot
   */
  bool offer(T value) {
    bool expected = false;
    if (!claimed_.compare_exchange_strong(expected, true)) {
      return false;
    }
    value_.emplace(std::move(value));
    filled_.store(true, std::memory_order_release);
    return true;
  }

  bool resolved() const noexcept { return claimed_.load(); }

  /**
   * @throws std::logic_error if nothing has been offered yet
   */
  const T& get() const {
    if (!filled_.load(std::memory_order_acquire)) {
      throw std::logic_error("OutcomeSlot: no outcome recorded");
    }
    return *value_;
  }

 private:
  std::atomic<bool> claimed_{false};
  std::atomic<bool> filled_{false};
  std::optional<T> value_;
};

}  // namespace session
}  // namespace weighlink
