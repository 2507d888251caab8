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

#ifndef TDQUOTE_QUOTE_TD_ATTRIBUTES_H_
#define TDQUOTE_QUOTE_TD_ATTRIBUTES_H_

#include <cstddef>
#include <cstdint>

#include "tdquote/util/bytes.h"

namespace tdquote {

// The TD attributes of a trust domain are a little-endian 64-bit vector
// split into three groups:
//   * TUD (bits 0-7): attributes of the TD under debug.
//   * SEC (bits 8-31): security attributes.
//   * OTHER (bits 32-63): attributes that do not affect TD security.
enum class TdAttributeGroup { TUD, SEC, OTHER };

// A named range of bits in the TD attributes vector. Ranges of width one are
// flags; wider ranges are reported as unsigned integers.
struct TdAttributeField {
  TdAttributeGroup group;
  const char *name;
  int bit_offset;
  int bit_width;
};

// The number of named TD attribute fields.
constexpr size_t kNumTdAttributeFields = 8;

// Every named TD attribute field, ordered by bit offset. Bits 28 and 29 are
// not covered by any field.
extern const TdAttributeField kTdAttributeFields[kNumTdAttributeFields];

// A bitmask over the TD attribute bits that belong to no named field.
extern const uint64_t kUnnamedTdAttributeBitsMask;

// The decoded view of a TD attributes vector. Reserved ranges are kept as
// integers so that unexpected bits remain visible.
struct TdAttributes {
  struct Tud {
    bool debug;
    uint8_t reserved;  // Bits 1-7.
  } tud;

  struct Sec {
    uint32_t reserved;  // Bits 8-26.
    bool sept_ve_disable;
    bool pks;
    bool kl;
  } sec;

  struct Other {
    uint32_t reserved;  // Bits 32-62.
    bool perfmon;
  } other;
};

bool operator==(const TdAttributes &lhs, const TdAttributes &rhs);
bool operator!=(const TdAttributes &lhs, const TdAttributes &rhs);

// Returns the name of |group| ("TUD", "SEC" or "OTHER").
const char *TdAttributeGroupName(TdAttributeGroup group);

// Interprets |td_attributes| as a little-endian 64-bit value.
uint64_t TdAttributesToUint64(const UnsafeBytes<8> &td_attributes);

// Returns the bits of |td_attributes| covered by |field|, shifted down to
// bit 0.
uint64_t ExtractTdAttributeField(uint64_t td_attributes,
                                 const TdAttributeField &field);

// Decomposes |td_attributes| into its named fields. Every bit pattern is
// accepted.
TdAttributes DecomposeTdAttributes(const UnsafeBytes<8> &td_attributes);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_TD_ATTRIBUTES_H_
