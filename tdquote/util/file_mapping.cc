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

#include "tdquote/util/file_mapping.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstddef>
#include <cstring>
#include <utility>

#include "absl/cleanup/cleanup.h"
#include "absl/strings/str_cat.h"
#include "tdquote/util/logging.h"
#include "tdquote/util/posix_errors.h"
#include "tdquote/util/status_macros.h"

namespace tdquote {

StatusOr<FileMapping> FileMapping::CreateFromFile(absl::string_view file_name) {
  // A null-terminated copy for open(). It is moved into the returned object.
  std::string file_name_string(file_name.data(), file_name.size());
  void *buffer_ptr = nullptr;
  size_t file_size = 0;

  int fd = open(file_name_string.c_str(), O_RDONLY);
  if (fd == -1) {
    return LastPosixError(absl::StrCat("Failed to open ", file_name));
  }

  // Closing the file does not invalidate the memory mapping.
  Status close_status;
  {
    auto close_fd = absl::MakeCleanup([fd, file_name, &close_status]() {
      if (close(fd) == -1) {
        close_status =
            LastPosixError(absl::StrCat("Failed to close ", file_name));
      }
    });

    struct stat file_stat;
    if (fstat(fd, &file_stat) == -1) {
      return LastPosixError(
          absl::StrCat("Failed to determine the size of ", file_name));
    }
    if (!S_ISREG(file_stat.st_mode)) {
      return PosixError(EINVAL,
                        absl::StrCat(file_name, " is not a regular file"));
    }
    file_size = static_cast<size_t>(file_stat.st_size);

    // mmap() rejects zero-length mappings.
    if (file_size > 0) {
      buffer_ptr = mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
      if (buffer_ptr == MAP_FAILED) {
        return LastPosixError(absl::StrCat("Failed to mmap ", file_name));
      }
    }
  }

  if (!close_status.ok()) {
    if (buffer_ptr != nullptr) {
      munmap(buffer_ptr, file_size);
    }
    return close_status;
  }

  VLOG(1) << "Mapped " << file_size << " bytes from " << file_name;
  return FileMapping(
      std::move(file_name_string),
      absl::MakeConstSpan(reinterpret_cast<const uint8_t *>(buffer_ptr),
                          file_size));
}

FileMapping::~FileMapping() {
  if (mapped_region_.data() &&
      munmap(const_cast<uint8_t *>(mapped_region_.data()),
             mapped_region_.size()) == -1) {
    LOG(FATAL) << absl::StrCat("Failed to unmap ", file_name_, ": ",
                               strerror(errno));
  }
}

void FileMapping::MoveFrom(FileMapping *other) {
  std::swap(file_name_, other->file_name_);
  std::swap(mapped_region_, other->mapped_region_);
}

}  // namespace tdquote
