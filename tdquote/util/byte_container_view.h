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

#ifndef TDQUOTE_UTIL_BYTE_CONTAINER_VIEW_H_
#define TDQUOTE_UTIL_BYTE_CONTAINER_VIEW_H_

#include <string.h>

#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "absl/strings/string_view.h"
#include "tdquote/util/byte_container_view_internal.h"

namespace tdquote {

// An immutable, non-owning view over a contiguous run of bytes.
//
// A ByteContainerView is implicitly constructible from any byte container
// (std::string, std::vector<uint8_t>, UnsafeBytes<N>, absl::Span<const
// uint8_t>, ...) as well as from a raw pointer and size. The caller must keep
// the viewed memory alive for as long as the view is used.
class ByteContainerView {
 public:
  using value_type = const uint8_t;
  using const_iterator = const uint8_t *;
  using iterator = const_iterator;

  ByteContainerView() = delete;

  ByteContainerView(const void *data, size_t size)
      : data_{reinterpret_cast<const uint8_t *>(data)}, size_{size} {}

  ByteContainerView(absl::string_view v)
      : data_{reinterpret_cast<const uint8_t *>(v.data())}, size_{v.size()} {}

  ByteContainerView(const char *cstr)
      : data_{reinterpret_cast<const uint8_t *>(cstr)},
        size_{cstr ? strlen(cstr) : 0} {}

  template <size_t kSize>
  constexpr ByteContainerView(const uint8_t (&data)[kSize])
      : data_{data}, size_{kSize} {}

  template <
      typename ByteContainerT,
      typename E = typename std::enable_if<
          internal::is_ro_byte_container_type<ByteContainerT>::value>::type>
  ByteContainerView(const ByteContainerT &container)
      : data_{reinterpret_cast<const uint8_t *>(container.data())},
        size_{container.size()} {}

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  const_iterator begin() const { return data_; }
  const_iterator end() const { return data_ + size_; }
  const_iterator cbegin() const { return data_; }
  const_iterator cend() const { return data_ + size_; }

  // No bounds check.
  const uint8_t &operator[](size_t offset) const { return data_[offset]; }

  bool operator==(ByteContainerView other) const {
    return (size_ == other.size_) && (memcmp(data_, other.data_, size_) == 0);
  }

  bool operator!=(ByteContainerView other) const { return !operator==(other); }

 private:
  const uint8_t *data_;
  size_t size_;
};

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_BYTE_CONTAINER_VIEW_H_
