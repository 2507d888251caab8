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

#include <iostream>
#include <vector>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_cat.h"
#include "tdquote/tools/quote_inspector_lib.h"

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(
      absl::StrCat("Decodes a TDX/SGX attestation quote and prints its "
                   "fields.\nUsage: ",
                   argv[0], " [flags] <quote_file>"));
  std::vector<char *> positional = absl::ParseCommandLine(argc, argv);
  return tdquote::RunQuoteInspector(positional, &std::cout, &std::cerr);
}
