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

#ifndef TDQUOTE_UTIL_BYTE_CONTAINER_VIEW_INTERNAL_H_
#define TDQUOTE_UTIL_BYTE_CONTAINER_VIEW_INTERNAL_H_

#include <type_traits>

namespace tdquote {
namespace internal {

// Exposes a static constexpr boolean |value| that is true if ByteContainerT
// has a one-byte value_type and provides data(), size(), begin() and end().
template <typename ByteContainerT>
struct is_ro_byte_container_type {
 private:
  template <typename ByteContainerU,
            typename E = typename std::enable_if<
                sizeof(typename ByteContainerU::value_type) == 1>::type>
  static std::true_type CheckSize(const ByteContainerU *u);

  template <typename ByteContainerU>
  static std::false_type CheckSize(...);

  using size_type = decltype(
      CheckSize<ByteContainerT>(static_cast<const ByteContainerT *>(0)));

  template <typename ByteContainerU>
  static auto CheckApi(const ByteContainerU *u)
      -> decltype(u->data(), u->size(), u->begin(), u->end(),
                  std::true_type());

  template <typename ByteContainerU>
  static std::false_type CheckApi(...);

  using api_type = decltype(
      CheckApi<ByteContainerT>(static_cast<const ByteContainerT *>(0)));

 public:
  static constexpr bool value = api_type::value & size_type::value;
};

}  // namespace internal
}  // namespace tdquote

#endif  // TDQUOTE_UTIL_BYTE_CONTAINER_VIEW_INTERNAL_H_
