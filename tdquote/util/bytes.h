/*
 *
 * Copyright 2026 tdquote authors
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
 *
 */

#ifndef TDQUOTE_UTIL_BYTES_H_
#define TDQUOTE_UTIL_BYTES_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "absl/base/attributes.h"
#include "tdquote/util/byte_container_view.h"

namespace tdquote {

// UnsafeBytes defines a fixed-size bag of |Size| bytes that is safe to embed in
// packed wire structures:
//  1. Its in-memory footprint is exactly |Size| bytes, with no alignment
//     padding and no vtable.
//  2. It is trivially copyable and trivially copy-assignable.
//  3. data() returns the address of the object itself.
//
// Its memory is not cleansed on destruction and equality uses memcmp, so it
// must not hold secrets.
template <size_t Size>
class UnsafeBytes {
 public:
  using value_type = uint8_t;
  using iterator = uint8_t *;
  using const_iterator = const uint8_t *;

  UnsafeBytes() = default;
  UnsafeBytes(const UnsafeBytes &) = default;
  UnsafeBytes &operator=(const UnsafeBytes &) = default;

  explicit UnsafeBytes(const uint8_t (&data)[Size]) { assign(data, Size); }

  // Copies min(|view|.size(), |Size|) bytes from |view|. Any remaining bytes
  // are zeroed.
  explicit UnsafeBytes(ByteContainerView view) {
    fill(0);
    assign(view.data(), view.size());
  }

  iterator begin() { return data_; }
  iterator end() { return data_ + Size; }
  const_iterator begin() const { return data_; }
  const_iterator end() const { return data_ + Size; }
  const_iterator cbegin() const { return data_; }
  const_iterator cend() const { return data_ + Size; }

  void fill(uint8_t value) { memset(data_, value, Size); }

  // Sets the buffer to min(|count|, |Size|) bytes from |ptr|. Returns the
  // number of bytes copied.
  size_t assign(const void *ptr, size_t count) {
    size_t assign_size = std::min(Size, count);
    memcpy(data_, ptr, assign_size);
    return assign_size;
  }

  size_t assign(ByteContainerView view) {
    return assign(view.data(), view.size());
  }

  uint8_t *data() { return data_; }
  const uint8_t *data() const { return data_; }

  uint8_t &operator[](size_t pos) { return data_[pos]; }
  const uint8_t &operator[](size_t pos) const { return data_[pos]; }

  bool Equals(ByteContainerView other) const {
    return Size == other.size() && memcmp(data_, other.data(), Size) == 0;
  }

  bool operator==(const UnsafeBytes &other) const { return Equals(other); }
  bool operator!=(const UnsafeBytes &other) const { return !Equals(other); }

  static constexpr size_t size() { return Size; }

  uint8_t data_[Size];
} ABSL_ATTRIBUTE_PACKED;

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_BYTES_H_
