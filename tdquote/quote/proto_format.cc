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

#include "tdquote/quote/proto_format.h"

#include <memory>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/text_format.h>
#include <google/protobuf/util/json_util.h>
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "tdquote/quote/quote.pb.h"

namespace tdquote {
namespace {

using google::protobuf::FieldDescriptor;
using google::protobuf::TextFormat;

// A FieldValuePrinter that prints a bytes field in hex.
class BytesPrinter : public TextFormat::FastFieldValuePrinter {
 public:
  void PrintBytes(const std::string &value,
                  TextFormat::BaseTextGenerator *generator) const override {
    generator->PrintLiteral("0x");
    generator->PrintString(absl::BytesToHexString(value));
  }
};

// Registers a BytesPrinter for every bytes field of |descriptor|.
void RegisterBytesPrinters(const google::protobuf::Descriptor *descriptor,
                           TextFormat::Printer *printer) {
  for (int i = 0; i < descriptor->field_count(); ++i) {
    const FieldDescriptor *field = descriptor->field(i);
    if (field->type() == FieldDescriptor::TYPE_BYTES) {
      printer->RegisterFieldValuePrinter(field, new BytesPrinter());
    }
  }
}

std::unique_ptr<TextFormat::Printer> CreateQuoteProtoPrinter() {
  auto printer = absl::make_unique<TextFormat::Printer>();
  RegisterBytesPrinters(QuoteHeaderProto::descriptor(), printer.get());
  RegisterBytesPrinters(TdQuoteBodyProto::descriptor(), printer.get());
  return printer;
}

}  // namespace

std::string FormatProto(const google::protobuf::Message &message) {
  static const TextFormat::Printer *printer =
      CreateQuoteProtoPrinter().release();

  std::string text;
  printer->PrintToString(message, &text);
  return text;
}

StatusOr<std::string> FormatProtoAsJson(
    const google::protobuf::Message &message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return absl::InternalError(
        absl::StrCat("Failed to convert ", message.GetTypeName(),
                     " to JSON: ", status.ToString()));
  }
  return json;
}

}  // namespace tdquote
