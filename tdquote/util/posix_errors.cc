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

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace tdquote {

Status PosixError(int errnum, absl::string_view message) {
  if (errnum == 0) {
    return absl::OkStatus();
  }
  return absl::ErrnoToStatus(errnum, message);
}

Status LastPosixError(absl::string_view message) {
  return PosixError(errno, message);
}

}  // namespace tdquote
