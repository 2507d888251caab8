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

#include "tdquote/quote/quote_decoder.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "tdquote/quote/quote_errors.h"
#include "tdquote/quote/tee_type.h"
#include "tdquote/util/byte_container_reader.h"
#include "tdquote/util/byte_container_util.h"
#include "tdquote/util/logging.h"
#include "tdquote/util/status_macros.h"

namespace tdquote {
namespace {

// Converts a failed read of |field_name| at |offset| into a TRUNCATED_INPUT
// quote error.
Status TruncatedFieldError(const Status &read_status,
                           absl::string_view field_name, size_t offset) {
  return QuoteError(TRUNCATED_INPUT, offset,
                    absl::StrCat("Failed to read ", field_name, ": ",
                                 read_status.message()));
}

template <typename IntT>
Status ReadInteger(absl::string_view field_name, ByteContainerReader *reader,
                   IntT *value) {
  size_t offset = reader->offset();
  Status status = reader->ReadLittleEndian(value);
  if (!status.ok()) {
    return TruncatedFieldError(status, field_name, offset);
  }
  return absl::OkStatus();
}

template <typename ObjT>
Status ReadObject(absl::string_view field_name, ByteContainerReader *reader,
                  ObjT *obj) {
  size_t offset = reader->offset();
  Status status = reader->ReadSingle(obj);
  if (!status.ok()) {
    return TruncatedFieldError(status, field_name, offset);
  }
  return absl::OkStatus();
}

Status ReadQuoteHeader(ByteContainerReader *reader, QuoteHeader *header) {
  TDQUOTE_RETURN_IF_ERROR(ReadInteger("version", reader, &header->version));
  TDQUOTE_RETURN_IF_ERROR(ReadInteger("attestation key type", reader,
                                      &header->attestation_key_type));

  uint32_t tee_type = 0;
  TDQUOTE_RETURN_IF_ERROR(ReadInteger("TEE type", reader, &tee_type));
  TDQUOTE_ASSIGN_OR_RETURN(header->tee_type, ParseTeeType(tee_type));

  TDQUOTE_RETURN_IF_ERROR(ReadObject("reserved1", reader, &header->reserved1));
  TDQUOTE_RETURN_IF_ERROR(ReadObject("reserved2", reader, &header->reserved2));
  TDQUOTE_RETURN_IF_ERROR(
      ReadObject("QE vendor ID", reader, &header->qe_vendor_id));
  return ReadObject("user data", reader, &header->user_data);
}

Status ReadQuoteBody(const DecodeOptions &options, ByteContainerReader *reader,
                     QuoteBody *body) {
  TDQUOTE_RETURN_IF_ERROR(
      ReadInteger("TD quote body type", reader, &body->body_type));

  size_t size_offset = reader->offset();
  TDQUOTE_RETURN_IF_ERROR(ReadInteger("body size", reader, &body->size));
  if (body->size != kTdQuoteBodySize) {
    std::string message =
        absl::StrFormat("Declared body size %d differs from the %d-byte TD "
                        "quote body layout",
                        body->size, kTdQuoteBodySize);
    if (options.enforce_body_size) {
      return QuoteError(BODY_SIZE_MISMATCH, size_offset, message);
    }
    LOG(WARNING) << message << "; decoding " << kTdQuoteBodySize
                 << " bytes regardless";
  }

  return ReadObject("TD quote body", reader, &body->td_quote_body);
}

}  // namespace

StatusOr<Quote> DecodeQuote(ByteContainerView buffer,
                            const DecodeOptions &options) {
  if (buffer.size() < kQuoteFixedRegionSize) {
    return QuoteError(
        TRUNCATED_INPUT, buffer.size(),
        absl::StrFormat("Quote is %d bytes long, but its fixed region "
                        "requires %d bytes",
                        buffer.size(), kQuoteFixedRegionSize));
  }

  ByteContainerReader reader(buffer);
  Quote quote;
  TDQUOTE_RETURN_IF_ERROR(ReadQuoteHeader(&reader, &quote.header));
  TDQUOTE_RETURN_IF_ERROR(ReadQuoteBody(options, &reader, &quote.body));
  quote.trailing_bytes = reader.BytesRemaining();

  VLOG(1) << "Decoded " << TeeTypeName(quote.header.tee_type)
          << " quote version " << quote.header.version << " with body type "
          << quote.body.body_type << " and " << quote.trailing_bytes
          << " trailing bytes";
  return quote;
}

std::vector<uint8_t> PackQuote(const Quote &quote) {
  std::vector<uint8_t> output;
  output.reserve(kQuoteFixedRegionSize);

  const QuoteHeader &header = quote.header;
  AppendLittleEndian(header.version, &output);
  AppendLittleEndian(header.attestation_key_type, &output);
  AppendLittleEndian(static_cast<uint32_t>(header.tee_type), &output);
  AppendTrivialObject(header.reserved1, &output);
  AppendTrivialObject(header.reserved2, &output);
  AppendTrivialObject(header.qe_vendor_id, &output);
  AppendTrivialObject(header.user_data, &output);

  AppendLittleEndian(quote.body.body_type, &output);
  AppendLittleEndian(quote.body.size, &output);
  AppendTrivialObject(quote.body.td_quote_body, &output);

  return output;
}

}  // namespace tdquote
