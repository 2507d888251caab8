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

#ifndef TDQUOTE_UTIL_FILE_MAPPING_H_
#define TDQUOTE_UTIL_FILE_MAPPING_H_

#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "tdquote/util/status.h"

namespace tdquote {

// An RAII object that owns a read-only mapping of a whole file into memory.
class FileMapping {
 public:
  // Returns a new FileMapping of |file_name| into memory, or a non-OK status if
  // the file cannot be opened, measured, or mapped. An empty file yields a
  // mapping with an empty buffer.
  static StatusOr<FileMapping> CreateFromFile(absl::string_view file_name);

  FileMapping() = default;

  FileMapping(const FileMapping &other) = delete;
  FileMapping &operator=(const FileMapping &other) = delete;

  FileMapping(FileMapping &&other) { MoveFrom(&other); }
  FileMapping &operator=(FileMapping &&other) {
    MoveFrom(&other);
    return *this;
  }

  ~FileMapping();

  // Returns the buffer that the file is mapped into.
  absl::Span<const uint8_t> buffer() const { return mapped_region_; }

  const std::string &file_name() const { return file_name_; }

 private:
  FileMapping(std::string &&file_name, absl::Span<const uint8_t> mapped_region)
      : file_name_(std::move(file_name)), mapped_region_(mapped_region) {}

  void MoveFrom(FileMapping *other);

  std::string file_name_;
  absl::Span<const uint8_t> mapped_region_;
};

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_FILE_MAPPING_H_
