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
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace weighlink {
namespace common {

/**
 * @brief A C++17 compatible non-owning view over contiguous bytes
 *
 * Chunks read from the serial port are handed to the decoders as spans so
 * the read buffer is never copied before it reaches the decode buffer.
 */
template <typename T>
class SafeSpan {
 public:
  using element_type = T;
  using value_type = std::remove_cv_t<T>;
  using size_type = std::size_t;
  using pointer = T*;
  using reference = T&;
  using iterator = T*;

  constexpr SafeSpan() noexcept : data_(nullptr), size_(0) {}

  constexpr SafeSpan(pointer data, size_type size) noexcept : data_(data), size_(size) {}

  template <typename Container>
  constexpr SafeSpan(const Container& container) noexcept
      : data_(reinterpret_cast<pointer>(container.data())), size_(container.size()) {}

  constexpr reference operator[](size_type index) const { return data_[index]; }

  constexpr reference at(size_type index) const {
    if (index >= size_) {
      throw std::out_of_range("SafeSpan index out of range");
    }
    return data_[index];
  }

  constexpr pointer data() const noexcept { return data_; }
  constexpr size_type size() const noexcept { return size_; }
  constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr iterator begin() const noexcept { return data_; }
  constexpr iterator end() const noexcept { return data_ + size_; }

  constexpr SafeSpan<T> subspan(size_type offset, size_type count = SIZE_MAX) const {
    if (offset > size_) {
      throw std::out_of_range("SafeSpan subspan offset out of range");
    }
    size_type actual_count = (count == SIZE_MAX) ? (size_ - offset) : count;
    if (offset + actual_count > size_) {
      throw std::out_of_range("SafeSpan subspan count out of range");
    }
    return SafeSpan<T>(data_ + offset, actual_count);
  }

 private:
  pointer data_;
  size_type size_;
};

using ConstByteSpan = SafeSpan<const uint8_t>;

inline ConstByteSpan as_bytes(std::string_view text) {
  return ConstByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

inline std::string to_string(ConstByteSpan bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

}  // namespace common
}  // namespace weighlink
