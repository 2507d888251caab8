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

#ifndef TDQUOTE_UTIL_HEX_UTIL_H_
#define TDQUOTE_UTIL_HEX_UTIL_H_

#include <cstddef>
#include <string>

#include "tdquote/util/byte_container_view.h"

namespace tdquote {

// Returns the lowercase hex encoding of |bytes|, two digits per byte, in the
// order the bytes appear in memory.
std::string BytesToHex(ByteContainerView bytes);

// Returns |bytes| as canonical UUID text (8-4-4-4-12 lowercase hex digits).
// The bytes are rendered in the order given, without any field byte-swapping.
// |bytes| must hold exactly 16 bytes; any other size yields "invalid-uuid".
std::string BytesToUuidString(ByteContainerView bytes);

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_HEX_UTIL_H_
