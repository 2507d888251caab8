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

#include "tdquote/tools/quote_inspector_lib.h"

#include <ostream>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "tdquote/quote/proto_format.h"
#include "tdquote/quote/quote_printer.h"
#include "tdquote/quote/quote_proto_util.h"
#include "tdquote/util/file_mapping.h"
#include "tdquote/util/logging.h"
#include "tdquote/util/status_helpers.h"
#include "tdquote/util/status_macros.h"

ABSL_FLAG(std::string, output_format, tdquote::kTextOutputFormat,
          "The output format to use. Valid options are 'text', 'textproto' or "
          "'json'. Defaults to text.");
ABSL_FLAG(bool, strict_body_size, false,
          "Reject quotes whose declared body size differs from the TD quote "
          "body layout instead of only logging a warning.");
ABSL_FLAG(std::string, log_dir, "",
          "If set, log messages are also appended to a file in this "
          "directory.");
ABSL_FLAG(int, v, 0, "Show all VLOG(m) messages for m <= this value.");

namespace tdquote {
namespace {

Status CheckOutputFormat(absl::string_view output_format) {
  if (output_format == kTextOutputFormat ||
      output_format == kTextProtoOutputFormat ||
      output_format == kJsonOutputFormat) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Invalid ", FLAGS_output_format.Name(), " value: ", output_format));
}

}  // namespace

DecodeOptions GetDecodeOptionsFromFlags() {
  DecodeOptions options;
  options.enforce_body_size = absl::GetFlag(FLAGS_strict_body_size);
  return options;
}

StatusOr<Quote> DecodeQuoteFile(absl::string_view file_name,
                                const DecodeOptions &options) {
  StatusOr<FileMapping> mapping_result = FileMapping::CreateFromFile(file_name);
  if (!mapping_result.ok()) {
    return WithContext(mapping_result.status(), "Cannot read quote file");
  }
  FileMapping mapping = std::move(mapping_result).value();
  VLOG(1) << "Decoding " << mapping.buffer().size() << " bytes from "
          << file_name;

  return WithContext(DecodeQuote(mapping.buffer(), options),
                     absl::StrCat("Cannot decode quote in ", file_name));
}

StatusOr<std::string> RenderQuote(const Quote &quote,
                                  absl::string_view output_format) {
  TDQUOTE_RETURN_IF_ERROR(CheckOutputFormat(output_format));

  if (output_format == kTextProtoOutputFormat) {
    return FormatProto(QuoteToProto(quote));
  }
  if (output_format == kJsonOutputFormat) {
    return FormatProtoAsJson(QuoteToProto(quote));
  }
  return FormatQuote(quote);
}

Status InspectQuoteFileAccordingToFlags(absl::string_view file_name,
                                        std::ostream *out) {
  std::string output_format = absl::GetFlag(FLAGS_output_format);
  TDQUOTE_RETURN_IF_ERROR(CheckOutputFormat(output_format));

  Quote quote;
  TDQUOTE_ASSIGN_OR_RETURN(
      quote, DecodeQuoteFile(file_name, GetDecodeOptionsFromFlags()));
  if (quote.trailing_bytes > 0) {
    VLOG(1) << "Ignoring " << quote.trailing_bytes
            << " bytes past the fixed region of the quote";
  }

  std::string rendering;
  TDQUOTE_ASSIGN_OR_RETURN(rendering, RenderQuote(quote, output_format));
  *out << rendering;
  if (!rendering.empty() && rendering.back() != '\n') {
    *out << "\n";
  }
  out->flush();
  return absl::OkStatus();
}

int RunQuoteInspector(absl::Span<char *const> positional, std::ostream *out,
                      std::ostream *err) {
  const char *program_name =
      positional.empty() ? "tdquote_inspector" : positional[0];
  if (positional.size() != 2) {
    *err << "Usage: " << program_name << " [flags] <quote_file>" << std::endl;
    return 1;
  }

  std::string log_dir = absl::GetFlag(FLAGS_log_dir);
  if (!InitLogging(log_dir.c_str(), program_name, absl::GetFlag(FLAGS_v))) {
    *err << "Cannot write logs to " << log_dir << std::endl;
    return 1;
  }

  Status status = InspectQuoteFileAccordingToFlags(positional[1], out);
  if (!status.ok()) {
    LOG(ERROR) << status.ToString(absl::StatusToStringMode::kWithNoExtraData);
    return 1;
  }
  return 0;
}

}  // namespace tdquote
