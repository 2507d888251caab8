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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "tdquote/test/util/status_matchers.h"

namespace tdquote {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class FileMappingTest : public ::testing::Test {
 protected:
  // Writes |contents| to a fresh file in the test's temporary directory and
  // returns its path.
  std::string WriteTestFile(const std::string &name,
                            const std::string &contents) {
    std::string path = absl::StrCat(::testing::TempDir(), "/", name);
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream << contents;
    stream.close();
    return path;
  }
};

TEST(FileMappingFixturelessTest, DefaultConstructedMappingIsEmpty) {
  FileMapping empty;
  EXPECT_THAT(empty.buffer(), IsEmpty());
}

TEST_F(FileMappingTest, MapsFileSuccessfully) {
  const std::string kContents("quote\0bytes", 11);
  std::string path = WriteTestFile("mapped_file", kContents);

  FileMapping mapping;
  TDQUOTE_ASSERT_OK_AND_ASSIGN(mapping, FileMapping::CreateFromFile(path));
  ASSERT_THAT(mapping.buffer().size(), Eq(kContents.size()));
  EXPECT_THAT(memcmp(mapping.buffer().data(), kContents.data(),
                     kContents.size()),
              Eq(0));
  EXPECT_THAT(mapping.file_name(), Eq(path));
}

TEST_F(FileMappingTest, MapsEmptyFileToEmptyBuffer) {
  std::string path = WriteTestFile("empty_file", "");

  FileMapping mapping;
  TDQUOTE_ASSERT_OK_AND_ASSIGN(mapping, FileMapping::CreateFromFile(path));
  EXPECT_THAT(mapping.buffer(), IsEmpty());
}

TEST_F(FileMappingTest, MovedMappingKeepsBuffer) {
  std::string path = WriteTestFile("moved_file", "abc");

  FileMapping original;
  TDQUOTE_ASSERT_OK_AND_ASSIGN(original, FileMapping::CreateFromFile(path));
  FileMapping moved = std::move(original);
  EXPECT_THAT(moved.buffer().size(), Eq(3));
  EXPECT_THAT(original.buffer(), IsEmpty());
}

TEST_F(FileMappingTest, MissingFileFailsWithPosixReason) {
  std::string path = absl::StrCat(::testing::TempDir(), "/does_not_exist");
  EXPECT_THAT(FileMapping::CreateFromFile(path),
              StatusIs(absl::StatusCode::kNotFound,
                       HasSubstr(strerror(ENOENT))));
  EXPECT_THAT(FileMapping::CreateFromFile(path),
              StatusIs(absl::StatusCode::kNotFound, HasSubstr(path)));
}

TEST_F(FileMappingTest, DirectoryIsRejected) {
  EXPECT_THAT(FileMapping::CreateFromFile(::testing::TempDir()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not a regular file")));
}

}  // namespace
}  // namespace tdquote
