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

#include "tdquote/util/hex_util.h"

#include <cstdint>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tdquote {
namespace {

using ::testing::Eq;

TEST(HexUtilTest, BytesToHexIsLowercaseInMemoryOrder) {
  const uint8_t kBytes[] = {0x00, 0x01, 0xab, 0xCD, 0xff};
  EXPECT_THAT(BytesToHex(kBytes), Eq("0001abcdff"));
  EXPECT_THAT(BytesToHex(ByteContainerView(kBytes, 0)), Eq(""));
}

TEST(HexUtilTest, BytesToUuidStringUsesCanonicalGrouping) {
  const uint8_t kVendorId[] = {0x93, 0x9a, 0x72, 0x33, 0xf7, 0x9c,
                               0x4c, 0xa9, 0x94, 0x0a, 0x0d, 0xb3,
                               0x95, 0x7f, 0x06, 0x07};
  EXPECT_THAT(BytesToUuidString(kVendorId),
              Eq("939a7233-f79c-4ca9-940a-0db3957f0607"));
}

TEST(HexUtilTest, BytesToUuidStringOfZeros) {
  const uint8_t kZeros[16] = {};
  EXPECT_THAT(BytesToUuidString(kZeros),
              Eq("00000000-0000-0000-0000-000000000000"));
}

TEST(HexUtilTest, BytesToUuidStringRejectsWrongSize) {
  const uint8_t kShort[15] = {};
  EXPECT_THAT(BytesToUuidString(kShort), Eq("invalid-uuid"));
}

}  // namespace
}  // namespace tdquote
