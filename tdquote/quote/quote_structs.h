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

#ifndef TDQUOTE_QUOTE_QUOTE_STRUCTS_H_
#define TDQUOTE_QUOTE_QUOTE_STRUCTS_H_

#include <cstddef>
#include <cstdint>

#include "absl/base/attributes.h"
#include "tdquote/util/bytes.h"

// This file defines the fixed region of an Intel DCAP attestation quote as
// produced for a TDX trust domain: the 48-byte quote header, the body-type and
// body-size preamble, and the TD quote body. Field names follow the Intel TDX
// DCAP Quoting Library API, with multi-word hardware names (MRSIGNERSEAM,
// REPORTDATA, ...) treated as single words.
//
// Byte-array fields are represented with UnsafeBytes since none of them are
// secrets. Integer fields are held in host byte order after decoding; on the
// wire every integer is little-endian.

namespace tdquote {

// Size of the quote header.
constexpr size_t kQuoteHeaderSize = 48;

// Size of the body-type and body-size fields that precede the TD quote body.
constexpr size_t kQuoteBodyPreambleSize = 6;

// Size of the TD quote body (the TDX 1.5 layout, which extends the 584-byte
// TDX 1.0 body with TEE_TCB_SVN_2 and MRSERVICETD).
constexpr size_t kTdQuoteBodySize = 648;

// Size of the fixed region of a quote. Any bytes past this offset (the
// signature and certification data) are not interpreted.
constexpr size_t kQuoteFixedRegionSize =
    kQuoteHeaderSize + kQuoteBodyPreambleSize + kTdQuoteBodySize;

// Known values of QuoteBody::body_type. They are reported but do not select a
// decoding variant.
constexpr uint16_t kSgxEnclaveReportBodyType = 1;
constexpr uint16_t kTd10ReportBodyType = 2;
constexpr uint16_t kTd15ReportBodyType = 3;

// The TEE that produced a quote. No other values are valid.
enum class TeeType : uint32_t {
  SGX = 0x00000000,
  TDX = 0x00000081,
};

struct QuoteHeader {
  uint16_t version;
  uint16_t attestation_key_type;
  TeeType tee_type;
  UnsafeBytes<2> reserved1;
  UnsafeBytes<2> reserved2;
  UnsafeBytes<16> qe_vendor_id;
  UnsafeBytes<20> user_data;
};

// The TD quote body, in wire order with no padding.
struct TdQuoteBody {
  UnsafeBytes<16> tee_tcb_svn;
  UnsafeBytes<48> mrseam;
  UnsafeBytes<48> mrsignerseam;
  UnsafeBytes<8> seam_attributes;
  UnsafeBytes<8> td_attributes;
  UnsafeBytes<8> xfam;
  UnsafeBytes<48> mrtd;
  UnsafeBytes<48> mrconfigid;
  UnsafeBytes<48> mrowner;
  UnsafeBytes<48> mrownerconfig;
  UnsafeBytes<48> rtmr0;
  UnsafeBytes<48> rtmr1;
  UnsafeBytes<48> rtmr2;
  UnsafeBytes<48> rtmr3;
  UnsafeBytes<64> report_data;
  UnsafeBytes<16> tee_tcb_svn_2;
  UnsafeBytes<48> mrservicetd;
} ABSL_ATTRIBUTE_PACKED;

static_assert(sizeof(TdQuoteBody) == kTdQuoteBodySize,
              "Size of TdQuoteBody struct is incorrect");

struct QuoteBody {
  uint16_t body_type;

  // The size the producer declared for |td_quote_body|. Advisory only.
  uint32_t size;

  TdQuoteBody td_quote_body;
};

struct Quote {
  QuoteHeader header;
  QuoteBody body;

  // Number of input bytes that follow the fixed region.
  size_t trailing_bytes;
};

bool operator==(const QuoteHeader &lhs, const QuoteHeader &rhs);
bool operator!=(const QuoteHeader &lhs, const QuoteHeader &rhs);
bool operator==(const TdQuoteBody &lhs, const TdQuoteBody &rhs);
bool operator!=(const TdQuoteBody &lhs, const TdQuoteBody &rhs);
bool operator==(const QuoteBody &lhs, const QuoteBody &rhs);
bool operator!=(const QuoteBody &lhs, const QuoteBody &rhs);
bool operator==(const Quote &lhs, const Quote &rhs);
bool operator!=(const Quote &lhs, const Quote &rhs);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_QUOTE_STRUCTS_H_
