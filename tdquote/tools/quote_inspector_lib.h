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

#ifndef TDQUOTE_TOOLS_QUOTE_INSPECTOR_LIB_H_
#define TDQUOTE_TOOLS_QUOTE_INSPECTOR_LIB_H_

#include <ostream>
#include <string>

#include "absl/flags/declare.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "tdquote/quote/quote_decoder.h"
#include "tdquote/quote/quote_structs.h"
#include "tdquote/util/status.h"

// How the decoded quote is written to stdout.
ABSL_DECLARE_FLAG(std::string, output_format);

// Whether a mismatched declared body size is an error.
ABSL_DECLARE_FLAG(bool, strict_body_size);

// Where log files are written, in addition to stderr.
ABSL_DECLARE_FLAG(std::string, log_dir);

// VLOG verbosity.
ABSL_DECLARE_FLAG(int, v);

namespace tdquote {

constexpr char kTextOutputFormat[] = "text";
constexpr char kTextProtoOutputFormat[] = "textproto";
constexpr char kJsonOutputFormat[] = "json";

// Returns the decoding options selected by command-line flags.
DecodeOptions GetDecodeOptionsFromFlags();

// Maps |file_name| into memory and decodes it. Errors are prefixed with the
// file name.
StatusOr<Quote> DecodeQuoteFile(absl::string_view file_name,
                                const DecodeOptions &options);

// Renders |quote| in |output_format|, which must be one of "text",
// "textproto" or "json".
StatusOr<std::string> RenderQuote(const Quote &quote,
                                  absl::string_view output_format);

// Decodes |file_name| and writes its rendering to |out| as directed by
// command-line flags. Nothing is written if any step fails.
Status InspectQuoteFileAccordingToFlags(absl::string_view file_name,
                                        std::ostream *out);

// Runs the inspector on the positional arguments left by
// absl::ParseCommandLine, with the program name first. Writes the rendering
// to |out| and usage or logging setup errors to |err|. Returns the process
// exit code: 0 on success, 1 on any failure.
int RunQuoteInspector(absl::Span<char *const> positional, std::ostream *out,
                      std::ostream *err);

}  // namespace tdquote

#endif  // TDQUOTE_TOOLS_QUOTE_INSPECTOR_LIB_H_
