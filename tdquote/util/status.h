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

#ifndef TDQUOTE_UTIL_STATUS_H_
#define TDQUOTE_UTIL_STATUS_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tdquote/util/logging.h"

namespace tdquote {

// All fallible tdquote operations report errors through `absl::Status`. These
// aliases keep signatures short.
using Status = ::absl::Status;

template <typename T>
using StatusOr = ::absl::StatusOr<T>;

// Checks that the `Status` object in `val` is OK.
#define TDQUOTE_CHECK_OK(val) CHECK_EQ(::absl::OkStatus(), (val))

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_STATUS_H_
