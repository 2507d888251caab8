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

#ifndef TDQUOTE_UTIL_STATUS_HELPERS_H_
#define TDQUOTE_UTIL_STATUS_HELPERS_H_

#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "tdquote/util/status.h"
#include "tdquote/util/status_helpers_internal.h"

namespace tdquote {

// Returns the type URL associated with a given protobuf message type. This
// should be used when embedding a message of that type as a payload in a
// `Status`.
template <typename MessageT>
std::string GetTypeUrl() {
  return internal::ProtoPayloadImpl<MessageT>::GetTypeUrl();
}

// Gets the payload of type `MessageT` in `status`. `MessageT` must be a
// protobuf message type.
//
// Returns `absl::nullopt` if `status` has no payload of that type or the
// payload does not parse.
template <typename MessageT>
absl::optional<MessageT> GetProtoPayload(const Status &status) {
  return internal::ProtoPayloadImpl<MessageT>::GetPayload(status);
}

// Adds a payload of type `MessageT` to `status`. A `Status` can only have one
// payload of any given message type.
//
// The message is embedded with the same type URL that would be used to pack
// the message into a `google::protobuf::Any`.
template <typename MessageT>
void SetProtoPayload(const MessageT &message, Status &status) {
  internal::ProtoPayloadImpl<MessageT>::SetPayload(message, status);
}

// Returns `status` with `context` prepended to its error message. All
// payloads are preserved. Returns `status` unchanged if it is OK.
Status WithContext(const Status &status, absl::string_view context);

// As the `Status` overload above, but for `StatusOr<T>`.
template <typename T>
StatusOr<T> WithContext(StatusOr<T> status_or, absl::string_view context) {
  if (status_or.ok()) {
    return status_or;
  }
  return WithContext(status_or.status(), context);
}

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_STATUS_HELPERS_H_
