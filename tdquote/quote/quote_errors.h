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

#ifndef TDQUOTE_QUOTE_QUOTE_ERRORS_H_
#define TDQUOTE_QUOTE_QUOTE_ERRORS_H_

#include <cstddef>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "tdquote/quote/quote_errors.pb.h"
#include "tdquote/util/status.h"

namespace tdquote {

// Returns an INVALID_ARGUMENT Status describing a quote-decoding failure of
// kind |code| detected at byte |offset| of the input.
//
// Callers should not rely on how QuoteError() embeds the error kind in the
// returned Status. Use GetQuoteErrorCode() to inspect it instead.
Status QuoteError(QuoteErrorCode code, size_t offset,
                  absl::string_view message);

// Returns the quote error code that |status| represents, or absl::nullopt if
// |status| does not represent a quote-decoding error.
absl::optional<QuoteErrorCode> GetQuoteErrorCode(const Status &status);

// Returns the byte offset recorded in a quote-decoding error, or
// absl::nullopt if |status| carries none.
absl::optional<size_t> GetQuoteErrorOffset(const Status &status);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_QUOTE_ERRORS_H_
