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

#include "tdquote/quote/td_attributes.h"

#include "tdquote/util/byte_container_reader.h"
#include "tdquote/util/status.h"

namespace tdquote {
namespace {

constexpr TdAttributeField kTudDebug = {TdAttributeGroup::TUD, "DEBUG", 0, 1};
constexpr TdAttributeField kTudReserved = {TdAttributeGroup::TUD, "RESERVED",
                                           1, 7};
constexpr TdAttributeField kSecReserved = {TdAttributeGroup::SEC, "RESERVED",
                                           8, 19};
constexpr TdAttributeField kSecSeptVeDisable = {TdAttributeGroup::SEC,
                                                "SEPT_VE_DISABLE", 27, 1};
// Bits 28 and 29 are unnamed.
constexpr TdAttributeField kSecPks = {TdAttributeGroup::SEC, "PKS", 30, 1};
constexpr TdAttributeField kSecKl = {TdAttributeGroup::SEC, "KL", 31, 1};
constexpr TdAttributeField kOtherReserved = {TdAttributeGroup::OTHER,
                                             "RESERVED", 32, 31};
constexpr TdAttributeField kOtherPerfmon = {TdAttributeGroup::OTHER, "PERFMON",
                                            63, 1};

constexpr uint64_t FieldMask(const TdAttributeField &field) {
  return (field.bit_width >= 64 ? ~uint64_t{0}
                                : ((uint64_t{1} << field.bit_width) - 1))
         << field.bit_offset;
}

}  // namespace

const TdAttributeField kTdAttributeFields[kNumTdAttributeFields] = {
    kTudDebug, kTudReserved, kSecReserved,   kSecSeptVeDisable,
    kSecPks,   kSecKl,       kOtherReserved, kOtherPerfmon,
};

const uint64_t kUnnamedTdAttributeBitsMask =
    ~(FieldMask(kTudDebug) | FieldMask(kTudReserved) |
      FieldMask(kSecReserved) | FieldMask(kSecSeptVeDisable) |
      FieldMask(kSecPks) | FieldMask(kSecKl) | FieldMask(kOtherReserved) |
      FieldMask(kOtherPerfmon));

bool operator==(const TdAttributes &lhs, const TdAttributes &rhs) {
  return lhs.tud.debug == rhs.tud.debug &&
         lhs.tud.reserved == rhs.tud.reserved &&
         lhs.sec.reserved == rhs.sec.reserved &&
         lhs.sec.sept_ve_disable == rhs.sec.sept_ve_disable &&
         lhs.sec.pks == rhs.sec.pks && lhs.sec.kl == rhs.sec.kl &&
         lhs.other.reserved == rhs.other.reserved &&
         lhs.other.perfmon == rhs.other.perfmon;
}

bool operator!=(const TdAttributes &lhs, const TdAttributes &rhs) {
  return !(lhs == rhs);
}

const char *TdAttributeGroupName(TdAttributeGroup group) {
  switch (group) {
    case TdAttributeGroup::TUD:
      return "TUD";
    case TdAttributeGroup::SEC:
      return "SEC";
    case TdAttributeGroup::OTHER:
      return "OTHER";
  }
  return "UNKNOWN";
}

uint64_t TdAttributesToUint64(const UnsafeBytes<8> &td_attributes) {
  uint64_t value = 0;
  ByteContainerReader reader(td_attributes);
  TDQUOTE_CHECK_OK(reader.ReadLittleEndian(&value));
  return value;
}

uint64_t ExtractTdAttributeField(uint64_t td_attributes,
                                 const TdAttributeField &field) {
  return (td_attributes & FieldMask(field)) >> field.bit_offset;
}

TdAttributes DecomposeTdAttributes(const UnsafeBytes<8> &td_attributes) {
  uint64_t value = TdAttributesToUint64(td_attributes);

  TdAttributes attributes;
  attributes.tud.debug = ExtractTdAttributeField(value, kTudDebug) != 0;
  attributes.tud.reserved =
      static_cast<uint8_t>(ExtractTdAttributeField(value, kTudReserved));

  attributes.sec.reserved =
      static_cast<uint32_t>(ExtractTdAttributeField(value, kSecReserved));
  attributes.sec.sept_ve_disable =
      ExtractTdAttributeField(value, kSecSeptVeDisable) != 0;
  attributes.sec.pks = ExtractTdAttributeField(value, kSecPks) != 0;
  attributes.sec.kl = ExtractTdAttributeField(value, kSecKl) != 0;

  attributes.other.reserved =
      static_cast<uint32_t>(ExtractTdAttributeField(value, kOtherReserved));
  attributes.other.perfmon = ExtractTdAttributeField(value, kOtherPerfmon) != 0;
  return attributes;
}

}  // namespace tdquote
