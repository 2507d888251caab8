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

#include "tdquote/quote/quote_errors.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "tdquote/util/status_helpers.h"

namespace tdquote {

Status QuoteError(QuoteErrorCode code, size_t offset,
                  absl::string_view message) {
  Status status = absl::InvalidArgumentError(
      absl::StrCat(QuoteErrorCode_Name(code), ": ", message));
  QuoteErrorDetails details;
  details.set_code(code);
  details.set_offset(offset);
  SetProtoPayload(details, status);
  return status;
}

absl::optional<QuoteErrorCode> GetQuoteErrorCode(const Status &status) {
  absl::optional<QuoteErrorDetails> details =
      GetProtoPayload<QuoteErrorDetails>(status);
  if (!details.has_value() || !details->has_code()) {
    return absl::nullopt;
  }
  return details->code();
}

absl::optional<size_t> GetQuoteErrorOffset(const Status &status) {
  absl::optional<QuoteErrorDetails> details =
      GetProtoPayload<QuoteErrorDetails>(status);
  if (!details.has_value() || !details->has_offset()) {
    return absl::nullopt;
  }
  return static_cast<size_t>(details->offset());
}

}  // namespace tdquote
