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

#ifndef TDQUOTE_QUOTE_QUOTE_PRINTER_H_
#define TDQUOTE_QUOTE_QUOTE_PRINTER_H_

#include <string>

#include "tdquote/quote/quote_structs.h"
#include "tdquote/quote/td_attributes.h"

namespace tdquote {

// Returns a human-readable rendering of |quote|, one field per line under
// "Quote Header:" and "Quote Body:" headings. Byte arrays are printed as
// lowercase hex, integers in decimal, the QE vendor ID as a UUID and the TEE
// type by name. The TD attributes are followed by their decomposition (see
// FormatTdAttributes()).
std::string FormatQuote(const Quote &quote);

// Returns the multi-line TUD/SEC/OTHER breakdown of |attributes|. DEBUG is
// printed as True/False, the remaining flags as 0/1 and reserved ranges in
// decimal. The result has no trailing newline.
std::string FormatTdAttributes(const TdAttributes &attributes);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_QUOTE_PRINTER_H_
