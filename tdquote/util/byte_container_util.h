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

#ifndef TDQUOTE_UTIL_BYTE_CONTAINER_UTIL_H_
#define TDQUOTE_UTIL_BYTE_CONTAINER_UTIL_H_

#include <endian.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <type_traits>

#include "tdquote/util/byte_container_view.h"

namespace tdquote {
namespace internal {

inline uint8_t HostToLittleEndian(uint8_t value) { return value; }
inline uint16_t HostToLittleEndian(uint16_t value) { return htole16(value); }
inline uint32_t HostToLittleEndian(uint32_t value) { return htole32(value); }
inline uint64_t HostToLittleEndian(uint64_t value) { return htole64(value); }

}  // namespace internal

// Appends the raw bytes of |obj| to |container|.
//
// ByteContainerT must have a value_type that is 1-byte in size.
template <class ByteContainerT, typename ObjT>
void AppendTrivialObject(const ObjT &obj, ByteContainerT *container) {
  static_assert(std::is_trivially_copy_assignable<ObjT>::value,
                "ObjT is not trivially copy-assignable.");
  static_assert(sizeof(typename ByteContainerT::value_type) == 1,
                "ByteContainerT must have a 1-byte value_type");
  ByteContainerView obj_bytes(&obj, sizeof(obj));
  std::copy(obj_bytes.cbegin(), obj_bytes.cend(),
            std::back_inserter(*container));
}

// Appends |value| to |container| in little-endian byte order.
template <class ByteContainerT, typename IntT>
void AppendLittleEndian(IntT value, ByteContainerT *container) {
  static_assert(std::is_unsigned<IntT>::value,
                "IntT must be an unsigned integer type");
  AppendTrivialObject(internal::HostToLittleEndian(value), container);
}

// Copies the contents of |view| into a new ByteContainerT.
template <class ByteContainerT>
ByteContainerT CopyToByteContainer(ByteContainerView view) {
  static_assert(
      sizeof(typename ByteContainerT::value_type) == 1,
      "ByteContainerT must be a container that uses 1-byte characters");
  return ByteContainerT(view.begin(), view.end());
}

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_BYTE_CONTAINER_UTIL_H_
