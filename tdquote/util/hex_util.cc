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

#include "tdquote/util/hex_util.h"

#include <string>
#include <vector>

#include "absl/strings/escaping.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"

namespace tdquote {
namespace {

constexpr size_t kUuidSize = 16;

// Byte lengths of the five dash-separated UUID groups.
constexpr size_t kUuidGroupSizes[] = {4, 2, 2, 2, 6};

}  // namespace

std::string BytesToHex(ByteContainerView bytes) {
  return absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

std::string BytesToUuidString(ByteContainerView bytes) {
  if (bytes.size() != kUuidSize) {
    return "invalid-uuid";
  }
  std::vector<std::string> groups;
  size_t offset = 0;
  for (size_t group_size : kUuidGroupSizes) {
    groups.push_back(
        BytesToHex(ByteContainerView(bytes.data() + offset, group_size)));
    offset += group_size;
  }
  return absl::StrJoin(groups, "-");
}

}  // namespace tdquote
