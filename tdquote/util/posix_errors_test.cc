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

#include "tdquote/util/posix_errors.h"

#include <cerrno>
#include <cstring>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "tdquote/test/util/status_matchers.h"
#include "tdquote/util/status.h"

namespace tdquote {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

TEST(PosixErrorsTest, PosixErrorReturnsOkIfErrnumIsZero) {
  TDQUOTE_EXPECT_OK(PosixError(0));
  TDQUOTE_EXPECT_OK(PosixError(0, "message"));
}

TEST(PosixErrorsTest, PosixErrorIsNotOkIfErrnumIsNonZero) {
  EXPECT_THAT(PosixError(EINVAL), Not(IsOk()));
  EXPECT_THAT(PosixError(ENOMEM, "no more memory"), Not(IsOk()));
}

TEST(PosixErrorsTest, PosixErrorContainsStrerrorAndMessage) {
  constexpr absl::string_view kMessage = "some message";
  Status error = PosixError(EINVAL, kMessage);
  EXPECT_THAT(error.message(), HasSubstr(strerror(EINVAL)));
  EXPECT_THAT(error.message(), HasSubstr(kMessage));
}

TEST(PosixErrorsTest, PosixErrorMapsErrnoToCanonicalCode) {
  EXPECT_THAT(PosixError(ENOENT), StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(PosixError(EACCES),
              StatusIs(absl::StatusCode::kPermissionDenied));
  EXPECT_THAT(PosixError(EINVAL),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(PosixErrorsTest, LastPosixErrorRepresentsErrno) {
  errno = EBADF;
  Status error = LastPosixError("closing");
  EXPECT_THAT(error.message(), HasSubstr(strerror(EBADF)));
  EXPECT_THAT(error.message(), HasSubstr("closing"));
}

}  // namespace
}  // namespace tdquote
