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

#ifndef TDQUOTE_QUOTE_PROTO_FORMAT_H_
#define TDQUOTE_QUOTE_PROTO_FORMAT_H_

#include <string>

#include <google/protobuf/message.h>
#include "tdquote/util/status.h"

namespace tdquote {

// Returns a formatted string containing a human-understandable representation
// of the given proto. The string is the same as the one returned by
// google::protobuf::Message::DebugString(), but every bytes field of the quote
// messages in quote.proto is printed as 0x-prefixed hex.
std::string FormatProto(const google::protobuf::Message &message);

// Returns the JSON form of |message| under protobuf's JSON mapping, keeping the
// field names used in the .proto file.
StatusOr<std::string> FormatProtoAsJson(
    const google::protobuf::Message &message);

}  // namespace tdquote

#endif  // TDQUOTE_QUOTE_PROTO_FORMAT_H_
