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

#ifndef TDQUOTE_UTIL_BYTE_CONTAINER_READER_H_
#define TDQUOTE_UTIL_BYTE_CONTAINER_READER_H_

#include <endian.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "tdquote/util/byte_container_view.h"
#include "tdquote/util/status.h"
#include "tdquote/util/status_macros.h"

namespace tdquote {
namespace internal {

inline uint8_t LittleEndianToHost(uint8_t value) { return value; }
inline uint16_t LittleEndianToHost(uint16_t value) { return le16toh(value); }
inline uint32_t LittleEndianToHost(uint32_t value) { return le32toh(value); }
inline uint64_t LittleEndianToHost(uint64_t value) { return le64toh(value); }

}  // namespace internal

// A forward-only cursor over a byte container, for reading packed structures
// field by field. Every read either consumes exactly the requested number of
// bytes or fails without consuming anything.
//
// ByteContainerReader keeps no copy of the source; the viewed buffer must
// outlive the reader.
class ByteContainerReader {
 public:
  explicit ByteContainerReader(ByteContainerView source)
      : source_(source), offset_(0) {}

  ByteContainerReader(const ByteContainerReader &) = delete;
  ByteContainerReader &operator=(const ByteContainerReader &) = delete;

  // Returns the number of bytes still available to be read.
  size_t BytesRemaining() const { return source_.size() - offset_; }

  // Returns the number of bytes consumed so far.
  size_t offset() const { return offset_; }

  // Reads sizeof(*obj) bytes into |obj|, which must be trivially
  // copy-assignable.
  template <typename ObjT>
  Status ReadSingle(ObjT *obj) {
    static_assert(std::is_trivially_copy_assignable<ObjT>::value,
                  "ObjT is not trivally copy-assignable");
    return ReadRaw(sizeof(*obj), obj);
  }

  // Reads an unsigned integer stored in little-endian byte order and converts
  // it to host order.
  template <typename IntT>
  Status ReadLittleEndian(IntT *value) {
    static_assert(std::is_unsigned<IntT>::value,
                  "IntT must be an unsigned integer type");
    IntT raw;
    TDQUOTE_RETURN_IF_ERROR(ReadSingle(&raw));
    *value = internal::LittleEndianToHost(raw);
    return absl::OkStatus();
  }

  // Reads |size| bytes into |output|. Returns INVALID_ARGUMENT if fewer than
  // |size| bytes remain.
  Status ReadRaw(size_t size, void *output) {
    if (size > BytesRemaining()) {
      return CreateReadTooLargeStatus(size);
    }

    memcpy(output, source_.data() + offset_, size);
    offset_ += size;
    return absl::OkStatus();
  }

 private:
  Status CreateReadTooLargeStatus(size_t size) const {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Attempted to read %d bytes at offset %d, but only %d are available",
        size, offset_, BytesRemaining()));
  }

  const ByteContainerView source_;
  size_t offset_;
};

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_BYTE_CONTAINER_READER_H_
