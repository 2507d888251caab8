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

#include "tdquote/quote/quote_errors.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/types/optional.h"
#include "tdquote/test/util/status_matchers.h"
#include "tdquote/util/status_helpers.h"

namespace tdquote {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Optional;

TEST(QuoteErrorsTest, QuoteErrorIsInvalidArgument) {
  EXPECT_THAT(QuoteError(TRUNCATED_INPUT, 10, "short"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "TRUNCATED_INPUT: short"));
}

TEST(QuoteErrorsTest, QuoteErrorCodeAndOffsetRoundTrip) {
  for (QuoteErrorCode code :
       {TRUNCATED_INPUT, UNRECOGNIZED_TEE_TYPE, BODY_SIZE_MISMATCH}) {
    Status status = QuoteError(code, 50, "message");
    EXPECT_THAT(GetQuoteErrorCode(status), Optional(Eq(code)));
    EXPECT_THAT(GetQuoteErrorOffset(status), Optional(Eq(50)));
  }
}

TEST(QuoteErrorsTest, NonQuoteErrorsHaveNoCode) {
  EXPECT_THAT(GetQuoteErrorCode(absl::OkStatus()), Eq(absl::nullopt));
  EXPECT_THAT(GetQuoteErrorCode(absl::InvalidArgumentError("other")),
              Eq(absl::nullopt));
  EXPECT_THAT(GetQuoteErrorOffset(absl::NotFoundError("other")),
              Eq(absl::nullopt));
}

TEST(QuoteErrorsTest, CodeSurvivesAddedContext) {
  Status status = WithContext(QuoteError(UNRECOGNIZED_TEE_TYPE, 4, "bad tee"),
                              "Cannot decode quote in q.dat");
  EXPECT_THAT(GetQuoteErrorCode(status), Optional(Eq(UNRECOGNIZED_TEE_TYPE)));
  EXPECT_THAT(status.message(), HasSubstr("q.dat"));
}

}  // namespace
}  // namespace tdquote
