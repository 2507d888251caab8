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

#include "tdquote/quote/quote_structs.h"

#include <cstring>

namespace tdquote {

bool operator==(const QuoteHeader &lhs, const QuoteHeader &rhs) {
  return lhs.version == rhs.version &&
         lhs.attestation_key_type == rhs.attestation_key_type &&
         lhs.tee_type == rhs.tee_type && lhs.reserved1 == rhs.reserved1 &&
         lhs.reserved2 == rhs.reserved2 &&
         lhs.qe_vendor_id == rhs.qe_vendor_id &&
         lhs.user_data == rhs.user_data;
}

bool operator!=(const QuoteHeader &lhs, const QuoteHeader &rhs) {
  return !(lhs == rhs);
}

// TdQuoteBody is packed, so its bytes are exactly its fields.
bool operator==(const TdQuoteBody &lhs, const TdQuoteBody &rhs) {
  return memcmp(&lhs, &rhs, sizeof(TdQuoteBody)) == 0;
}

bool operator!=(const TdQuoteBody &lhs, const TdQuoteBody &rhs) {
  return !(lhs == rhs);
}

bool operator==(const QuoteBody &lhs, const QuoteBody &rhs) {
  return lhs.body_type == rhs.body_type && lhs.size == rhs.size &&
         lhs.td_quote_body == rhs.td_quote_body;
}

bool operator!=(const QuoteBody &lhs, const QuoteBody &rhs) {
  return !(lhs == rhs);
}

bool operator==(const Quote &lhs, const Quote &rhs) {
  return lhs.header == rhs.header && lhs.body == rhs.body &&
         lhs.trailing_bytes == rhs.trailing_bytes;
}

bool operator!=(const Quote &lhs, const Quote &rhs) { return !(lhs == rhs); }

}  // namespace tdquote
