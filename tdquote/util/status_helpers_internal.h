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

#ifndef TDQUOTE_UTIL_STATUS_HELPERS_INTERNAL_H_
#define TDQUOTE_UTIL_STATUS_HELPERS_INTERNAL_H_

#include <string>
#include <type_traits>

#include <google/protobuf/any.pb.h>
#include <google/protobuf/message.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace tdquote {
namespace internal {

template <typename MessageT>
struct ProtoPayloadImpl {
  static_assert(std::is_base_of<google::protobuf::Message, MessageT>::value,
                "MessageT must be a protobuf message type");

  static std::string GetTypeUrl() {
    google::protobuf::Any any;
    any.PackFrom(MessageT());
    return std::string(any.type_url());
  }

  static absl::optional<MessageT> GetPayload(const absl::Status &status) {
    absl::optional<absl::Cord> payload = status.GetPayload(GetTypeUrl());
    if (!payload.has_value()) {
      return absl::nullopt;
    }
    MessageT message;
    if (!message.ParseFromString(std::string(payload.value()))) {
      return absl::nullopt;
    }
    return message;
  }

  static void SetPayload(const MessageT &message, absl::Status &status) {
    status.SetPayload(GetTypeUrl(), absl::Cord(message.SerializeAsString()));
  }
};

}  // namespace internal
}  // namespace tdquote

#endif  // TDQUOTE_UTIL_STATUS_HELPERS_INTERNAL_H_
