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

#ifndef TDQUOTE_QUOTE_QUOTE_PROTO_UTIL_H_
#define TDQUOTE_QUOTE_QUOTE_PROTO_UTIL_H_

#include "tdquote/quote/quote.pb.h"
#include "tdquote/quote/quote_structs.h"
#include "tdquote/quote/td_attributes.h"

namespace tdquote {

// Converts |attributes| to its protobuf form.
TdAttributesProto TdAttributesToProto(const TdAttributes &attributes);

// Converts |quote| to its protobuf form, including the decomposed TD
// attributes.
QuoteProto QuoteToProto(const Quote &quote);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_QUOTE_PROTO_UTIL_H_
