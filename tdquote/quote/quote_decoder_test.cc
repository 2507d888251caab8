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

#include "tdquote/quote/quote_decoder.h"

#include <cstdint>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "tdquote/quote/quote_errors.h"
#include "tdquote/test/util/quote_test_util.h"
#include "tdquote/test/util/status_matchers.h"
#include "tdquote/util/byte_container_util.h"
#include "tdquote/util/bytes.h"

namespace tdquote {
namespace {

using ::testing::ElementsAreArray;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Optional;
using ::testing::Test;

class QuoteDecoderTest : public Test {
 protected:
  void ExpectQuoteEquals(const StatusOr<Quote> &actual_quote,
                         const Quote &expected_quote) {
    TDQUOTE_ASSERT_OK(actual_quote);
    const Quote &actual = actual_quote.value();
    EXPECT_THAT(actual.header.version, Eq(expected_quote.header.version));
    EXPECT_THAT(actual.header.attestation_key_type,
                Eq(expected_quote.header.attestation_key_type));
    EXPECT_THAT(actual.header.tee_type, Eq(expected_quote.header.tee_type));
    EXPECT_TRUE(actual.header == expected_quote.header);
    EXPECT_THAT(actual.body.body_type, Eq(expected_quote.body.body_type));
    EXPECT_THAT(actual.body.size, Eq(expected_quote.body.size));
    EXPECT_TRUE(actual.body.td_quote_body ==
                expected_quote.body.td_quote_body);
    EXPECT_THAT(actual.trailing_bytes, Eq(expected_quote.trailing_bytes));
  }

  void ExpectQuoteError(const StatusOr<Quote> &result, QuoteErrorCode code) {
    EXPECT_THAT(result, StatusIs(absl::StatusCode::kInvalidArgument));
    EXPECT_THAT(GetQuoteErrorCode(result.status()), Optional(Eq(code)));
  }
};

TEST_F(QuoteDecoderTest, PackedQuoteHasFixedRegionSize) {
  EXPECT_THAT(kQuoteFixedRegionSize, Eq(702));
  EXPECT_THAT(PackQuote(CreateRandomQuote()).size(),
              Eq(kQuoteFixedRegionSize));
}

TEST_F(QuoteDecoderTest, DecodesTdxQuote) {
  const Quote kExpectedQuote = CreateRandomQuote(TeeType::TDX);
  ExpectQuoteEquals(DecodeQuote(PackQuote(kExpectedQuote)), kExpectedQuote);
}

TEST_F(QuoteDecoderTest, DecodesSgxQuote) {
  const Quote kExpectedQuote = CreateRandomQuote(TeeType::SGX);
  ExpectQuoteEquals(DecodeQuote(PackQuote(kExpectedQuote)), kExpectedQuote);
}

TEST_F(QuoteDecoderTest, FieldsComeFromDocumentedOffsets) {
  std::vector<uint8_t> packed(kQuoteFixedRegionSize);
  for (size_t i = 0; i < packed.size(); ++i) {
    packed[i] = static_cast<uint8_t>(i);
  }
  SetPackedUint32(kPackedTeeTypeOffset, 0x81, &packed);

  Quote quote;
  TDQUOTE_ASSERT_OK_AND_ASSIGN(quote, DecodeQuote(packed));
  EXPECT_THAT(quote.header.version, Eq(0x0100));
  EXPECT_THAT(quote.header.attestation_key_type, Eq(0x0302));
  EXPECT_THAT(quote.header.tee_type, Eq(TeeType::TDX));
  EXPECT_THAT(quote.header.reserved1, ElementsAreArray(&packed[8], 2));
  EXPECT_THAT(quote.header.reserved2, ElementsAreArray(&packed[10], 2));
  EXPECT_THAT(quote.header.qe_vendor_id, ElementsAreArray(&packed[12], 16));
  EXPECT_THAT(quote.header.user_data, ElementsAreArray(&packed[28], 20));
  EXPECT_THAT(quote.body.body_type, Eq(0x3130));
  EXPECT_THAT(quote.body.size, Eq(0x35343332u));

  const TdQuoteBody &body = quote.body.td_quote_body;
  EXPECT_THAT(body.tee_tcb_svn, ElementsAreArray(&packed[54], 16));
  EXPECT_THAT(body.mrseam, ElementsAreArray(&packed[70], 48));
  EXPECT_THAT(body.td_attributes,
              ElementsAreArray(&packed[kPackedTdAttributesOffset], 8));
  EXPECT_THAT(body.report_data, ElementsAreArray(&packed[574], 64));
  EXPECT_THAT(body.tee_tcb_svn_2, ElementsAreArray(&packed[638], 16));
  EXPECT_THAT(body.mrservicetd, ElementsAreArray(&packed[654], 48));
  EXPECT_THAT(quote.trailing_bytes, Eq(0));
}

TEST_F(QuoteDecoderTest, EveryShortBufferIsTruncated) {
  std::vector<uint8_t> packed_quote = PackQuote(CreateRandomQuote());
  do {
    packed_quote.pop_back();
    ExpectQuoteError(DecodeQuote(packed_quote), TRUNCATED_INPUT);
  } while (!packed_quote.empty());
}

TEST_F(QuoteDecoderTest, TruncationIsReportedBeforeTeeType) {
  std::vector<uint8_t> packed_quote = PackQuote(CreateRandomQuote());
  SetPackedUint32(kPackedTeeTypeOffset, 0x42, &packed_quote);
  packed_quote.resize(100);
  ExpectQuoteError(DecodeQuote(packed_quote), TRUNCATED_INPUT);
}

TEST_F(QuoteDecoderTest, UnrecognizedTeeTypeIsRejected) {
  std::vector<uint8_t> packed_quote = PackQuote(CreateRandomQuote());
  for (uint32_t tee_type : {0x1u, 0x80u, 0x82u, 0xffffffffu}) {
    SetPackedUint32(kPackedTeeTypeOffset, tee_type, &packed_quote);
    StatusOr<Quote> result = DecodeQuote(packed_quote);
    ExpectQuoteError(result, UNRECOGNIZED_TEE_TYPE);
    EXPECT_THAT(GetQuoteErrorOffset(result.status()),
                Optional(Eq(kPackedTeeTypeOffset)));
  }
}

TEST_F(QuoteDecoderTest, DeclaredBodySizeIsAdvisoryByDefault) {
  Quote expected_quote = CreateRandomQuote();
  expected_quote.body.size = 584;
  ExpectQuoteEquals(DecodeQuote(PackQuote(expected_quote)), expected_quote);
}

TEST_F(QuoteDecoderTest, StrictModeRejectsMismatchedBodySize) {
  Quote quote = CreateRandomQuote();
  quote.body.size = 584;

  DecodeOptions options;
  options.enforce_body_size = true;
  StatusOr<Quote> result = DecodeQuote(PackQuote(quote), options);
  ExpectQuoteError(result, BODY_SIZE_MISMATCH);
  EXPECT_THAT(result.status().message(), HasSubstr("584"));
  EXPECT_THAT(GetQuoteErrorOffset(result.status()),
              Optional(Eq(kPackedBodySizeOffset)));
}

TEST_F(QuoteDecoderTest, StrictModeAcceptsMatchingBodySize) {
  const Quote kExpectedQuote = CreateRandomQuote();
  DecodeOptions options;
  options.enforce_body_size = true;
  ExpectQuoteEquals(DecodeQuote(PackQuote(kExpectedQuote), options),
                    kExpectedQuote);
}

TEST_F(QuoteDecoderTest, TrailingBytesAreCountedAndIgnored) {
  Quote expected_quote = CreateRandomQuote();
  std::vector<uint8_t> packed_quote = PackQuote(expected_quote);
  AppendTrivialObject(TrivialOnesObject<UnsafeBytes<123>>(), &packed_quote);

  expected_quote.trailing_bytes = 123;
  ExpectQuoteEquals(DecodeQuote(packed_quote), expected_quote);
}

TEST_F(QuoteDecoderTest, RoundTripDecodePack) {
  std::vector<uint8_t> packed_quote = PackQuote(CreateRandomQuote());

  Quote decoded_quote;
  TDQUOTE_ASSERT_OK_AND_ASSIGN(decoded_quote, DecodeQuote(packed_quote));
  EXPECT_THAT(PackQuote(decoded_quote), ElementsAreArray(packed_quote));
}

}  // namespace
}  // namespace tdquote
