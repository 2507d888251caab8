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

#include "tdquote/quote/tee_type.h"

#include "absl/strings/str_cat.h"
#include "tdquote/quote/quote_errors.h"

namespace tdquote {
namespace {

// Offset of the TEE-type field within the quote header.
constexpr size_t kTeeTypeOffset = 4;

}  // namespace

StatusOr<TeeType> ParseTeeType(uint32_t value) {
  switch (value) {
    case static_cast<uint32_t>(TeeType::SGX):
      return TeeType::SGX;
    case static_cast<uint32_t>(TeeType::TDX):
      return TeeType::TDX;
  }
  return QuoteError(
      UNRECOGNIZED_TEE_TYPE, kTeeTypeOffset,
      absl::StrCat("Unrecognized TEE type 0x",
                   absl::Hex(value, absl::kZeroPad8),
                   " (expected 0x00000000 for SGX or 0x00000081 for TDX)"));
}

std::string TeeTypeName(TeeType tee_type) {
  switch (tee_type) {
    case TeeType::SGX:
      return "SGX";
    case TeeType::TDX:
      return "TDX";
  }
  return absl::StrCat("TeeType(", static_cast<uint32_t>(tee_type), ")");
}

}  // namespace tdquote
