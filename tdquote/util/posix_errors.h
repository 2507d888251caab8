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

#ifndef TDQUOTE_UTIL_POSIX_ERRORS_H_
#define TDQUOTE_UTIL_POSIX_ERRORS_H_

#include "absl/strings/string_view.h"
#include "tdquote/util/status.h"

namespace tdquote {

// Returns a Status for the POSIX error number |errnum|, or OK if it is zero.
// The status code is the canonical code for |errnum| and the message is
// |message| followed by the strerror(3) explanation.
Status PosixError(int errnum, absl::string_view message = "");

// Returns a Status representing the last POSIX error in this thread.
//
// Equivalent to calling `PosixError(errno, message)`.
Status LastPosixError(absl::string_view message = "");

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_POSIX_ERRORS_H_
