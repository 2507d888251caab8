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

#ifndef TDQUOTE_QUOTE_QUOTE_DECODER_H_
#define TDQUOTE_QUOTE_QUOTE_DECODER_H_

#include <cstdint>
#include <vector>

#include "tdquote/quote/quote_structs.h"
#include "tdquote/util/byte_container_view.h"
#include "tdquote/util/status.h"

namespace tdquote {

struct DecodeOptions {
  // If true, a body whose declared size is not kTdQuoteBodySize is rejected
  // with BODY_SIZE_MISMATCH. Otherwise the mismatch is only logged.
  bool enforce_body_size = false;
};

// Decodes the fixed region of |buffer| into a Quote.
//
// Fails with a quote error (see quote_errors.h) of kind:
//   * TRUNCATED_INPUT if |buffer| is shorter than kQuoteFixedRegionSize. No
//     field is read in that case.
//   * UNRECOGNIZED_TEE_TYPE if the header's TEE type is neither SGX nor TDX.
//     Body fields are not read in that case.
//   * BODY_SIZE_MISMATCH if |options|.enforce_body_size is set and the
//     declared body size differs from kTdQuoteBodySize.
//
// Bytes past the fixed region are counted in Quote::trailing_bytes and
// otherwise ignored.
StatusOr<Quote> DecodeQuote(ByteContainerView buffer,
                            const DecodeOptions &options = DecodeOptions());

// Serializes the fixed region of |quote| in wire format. The result is
// kQuoteFixedRegionSize bytes long; |quote|.trailing_bytes is not
// represented.
std::vector<uint8_t> PackQuote(const Quote &quote);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_QUOTE_DECODER_H_
