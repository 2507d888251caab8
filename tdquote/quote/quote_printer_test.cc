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

#include "tdquote/quote/quote_printer.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/strings/str_cat.h"
#include "tdquote/util/trivial_object_util.h"

namespace tdquote {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::StartsWith;
using ::testing::Test;

class QuotePrinterTest : public Test {
 protected:
  void SetUp() override {
    quote_ = TrivialZeroObject<Quote>();
    quote_.header.version = 4;
    quote_.header.attestation_key_type = 2;
    quote_.header.tee_type = TeeType::TDX;
    const uint8_t kVendorId[] = {0x93, 0x9a, 0x72, 0x33, 0xf7, 0x9c,
                                 0x4c, 0xa9, 0x94, 0x0a, 0x0d, 0xb3,
                                 0x95, 0x7f, 0x06, 0x07};
    quote_.header.qe_vendor_id.assign(kVendorId, sizeof(kVendorId));
    quote_.body.body_type = kTd15ReportBodyType;
    quote_.body.size = kTdQuoteBodySize;
    quote_.body.td_quote_body.mrtd.fill(0xab);
    quote_.body.td_quote_body.td_attributes[0] = 0x01;
    quote_.body.td_quote_body.td_attributes[3] = 0x10;
  }

  Quote quote_;
};

TEST_F(QuotePrinterTest, HeaderSection) {
  std::string text = FormatQuote(quote_);
  EXPECT_THAT(text, StartsWith("Quote Header:\n"
                               "  Version: 4\n"
                               "  Attestation Key Type: 2\n"
                               "  TEE Type: TDX\n"
                               "  Reserved 1: 0000\n"
                               "  Reserved 2: 0000\n"
                               "  QE Vendor ID: "
                               "939a7233-f79c-4ca9-940a-0db3957f0607\n"
                               "  User Data: "
                               "0000000000000000000000000000000000000000\n"
                               "Quote Body:\n"
                               "  TD Quote Body Type: 3\n"
                               "  Size: 648\n"));
}

TEST_F(QuotePrinterTest, BodyFieldsInWireOrder) {
  std::string text = FormatQuote(quote_);
  const char *kLabels[] = {
      "  TEE TCB SVN: ",   "  MRSEAM: ",        "  MRSIGNERSEAM: ",
      "  Seam Attributes: ", "  TD Attributes: ", "  XFAM: ",
      "  MRTD: ",          "  MRCONFIGID: ",    "  MROWNER: ",
      "  MROWNERCONFIG: ", "  RTMR0: ",         "  RTMR1: ",
      "  RTMR2: ",         "  RTMR3: ",         "  Report Data: ",
      "  TEE TCB SVN 2: ", "  MRSERVICETD: ",
  };
  size_t position = 0;
  for (const char *label : kLabels) {
    size_t found = text.find(label, position);
    ASSERT_NE(found, std::string::npos) << label;
    position = found + 1;
  }
}

TEST_F(QuotePrinterTest, ByteArraysAreHex) {
  std::string mrtd_hex;
  for (int i = 0; i < 48; ++i) {
    mrtd_hex += "ab";
  }

  std::string text = FormatQuote(quote_);
  EXPECT_THAT(text, HasSubstr(absl::StrCat("  MRTD: ", mrtd_hex, "\n")));
  EXPECT_THAT(text, HasSubstr("  TD Attributes: 0100001000000000\n"));
  EXPECT_THAT(text, HasSubstr(absl::StrCat("  MRSERVICETD: ",
                                           std::string(96, '0'), "\n")));
}

// Bit 28 is set but belongs to no named field.
TEST_F(QuotePrinterTest, TdAttributesBreakdownFollowsAttributes) {
  std::string text = FormatQuote(quote_);
  EXPECT_THAT(text, HasSubstr("  TD Attributes: 0100001000000000\n"
                              "  \tTUD:\n"
                              "\t   DEBUG: True\n"
                              "\t   RESERVED: 0\n"
                              "\tSEC:\n"
                              "\t  RESERVED: 0\n"
                              "\t  SEPT_VE_DISABLE: 0\n"
                              "\t  PKS: 0\n"
                              "\t  KL: 0\n"
                              "\tOTHER:\n"
                              "\t  RESERVED: 0\n"
                              "\t  PERFMON: 0\n"
                              "  XFAM: "));
}

TEST_F(QuotePrinterTest, SgxTeeTypeByName) {
  quote_.header.tee_type = TeeType::SGX;
  EXPECT_THAT(FormatQuote(quote_), HasSubstr("  TEE Type: SGX\n"));
}

TEST(FormatTdAttributesTest, AllFlagsSet) {
  TdAttributes attributes =
      DecomposeTdAttributes(TrivialOnesObject<UnsafeBytes<8>>());
  EXPECT_THAT(FormatTdAttributes(attributes),
              Eq("TUD:\n"
                 "\t   DEBUG: True\n"
                 "\t   RESERVED: 127\n"
                 "\tSEC:\n"
                 "\t  RESERVED: 524287\n"
                 "\t  SEPT_VE_DISABLE: 1\n"
                 "\t  PKS: 1\n"
                 "\t  KL: 1\n"
                 "\tOTHER:\n"
                 "\t  RESERVED: 2147483647\n"
                 "\t  PERFMON: 1"));
}

TEST(FormatTdAttributesTest, AllFlagsClear) {
  TdAttributes attributes =
      DecomposeTdAttributes(TrivialZeroObject<UnsafeBytes<8>>());
  EXPECT_THAT(FormatTdAttributes(attributes),
              HasSubstr("\t   DEBUG: False\n"));
}

}  // namespace
}  // namespace tdquote
