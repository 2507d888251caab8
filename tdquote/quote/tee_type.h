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

#ifndef TDQUOTE_QUOTE_TEE_TYPE_H_
#define TDQUOTE_QUOTE_TEE_TYPE_H_

#include <cstdint>
#include <string>

#include "tdquote/quote/quote_structs.h"
#include "tdquote/util/status.h"

namespace tdquote {

// Returns the TeeType whose wire value is |value|, or an
// UNRECOGNIZED_TEE_TYPE quote error naming |value| in hex.
StatusOr<TeeType> ParseTeeType(uint32_t value);

// Returns "SGX" or "TDX".
std::string TeeTypeName(TeeType tee_type);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_TEE_TYPE_H_
