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

#ifndef TDQUOTE_UTIL_TRIVIAL_OBJECT_UTIL_H_
#define TDQUOTE_UTIL_TRIVIAL_OBJECT_UTIL_H_

#include <openssl/rand.h>

#include <cstdint>
#include <cstring>
#include <type_traits>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "tdquote/util/status.h"

namespace tdquote {

// Fills |obj| with cryptographically random bytes. Returns an INTERNAL error
// if OpenSSL's generator fails.
template <class T>
Status RandomFillTrivialObject(T *obj) {
  static_assert(std::is_trivially_copy_assignable<T>::value,
                "Template parameter is not trivially copy-assignable.");
  if (RAND_bytes(reinterpret_cast<uint8_t *>(obj), sizeof(*obj)) != 1) {
    return absl::InternalError(
        absl::StrCat("RAND_bytes failed to fill ", sizeof(*obj), " bytes"));
  }
  return absl::OkStatus();
}

template <class T>
T TrivialZeroObject() {
  static_assert(std::is_trivially_copy_assignable<T>::value,
                "Template parameter is not trivially copy-assignable.");
  T tmp;
  memset(&tmp, 0, sizeof(tmp));
  return tmp;
}

template <class T>
T TrivialOnesObject() {
  static_assert(std::is_trivially_copy_assignable<T>::value,
                "Template parameter is not trivially copy-assignable.");
  T tmp;
  memset(&tmp, 0xff, sizeof(tmp));
  return tmp;
}

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_TRIVIAL_OBJECT_UTIL_H_
