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

#include "tdquote/quote/quote_printer.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tdquote/quote/tee_type.h"
#include "tdquote/util/byte_container_view.h"
#include "tdquote/util/hex_util.h"

namespace tdquote {
namespace {

void AppendLine(absl::string_view label, absl::string_view value,
                std::string *output) {
  absl::StrAppend(output, "  ", label, ": ", value, "\n");
}

void AppendHexLine(absl::string_view label, ByteContainerView bytes,
                   std::string *output) {
  AppendLine(label, BytesToHex(bytes), output);
}

}  // namespace

std::string FormatTdAttributes(const TdAttributes &attributes) {
  return absl::StrCat(
      "TUD:\n",
      "\t   DEBUG: ", attributes.tud.debug ? "True" : "False", "\n",
      "\t   RESERVED: ", attributes.tud.reserved, "\n",
      "\tSEC:\n",
      "\t  RESERVED: ", attributes.sec.reserved, "\n",
      "\t  SEPT_VE_DISABLE: ", attributes.sec.sept_ve_disable ? 1 : 0, "\n",
      "\t  PKS: ", attributes.sec.pks ? 1 : 0, "\n",
      "\t  KL: ", attributes.sec.kl ? 1 : 0, "\n",
      "\tOTHER:\n",
      "\t  RESERVED: ", attributes.other.reserved, "\n",
      "\t  PERFMON: ", attributes.other.perfmon ? 1 : 0);
}

std::string FormatQuote(const Quote &quote) {
  const QuoteHeader &header = quote.header;
  std::string output = "Quote Header:\n";
  AppendLine("Version", absl::StrCat(header.version), &output);
  AppendLine("Attestation Key Type", absl::StrCat(header.attestation_key_type),
             &output);
  AppendLine("TEE Type", TeeTypeName(header.tee_type), &output);
  AppendHexLine("Reserved 1", header.reserved1, &output);
  AppendHexLine("Reserved 2", header.reserved2, &output);
  AppendLine("QE Vendor ID", BytesToUuidString(header.qe_vendor_id), &output);
  AppendHexLine("User Data", header.user_data, &output);

  const TdQuoteBody &body = quote.body.td_quote_body;
  absl::StrAppend(&output, "Quote Body:\n");
  AppendLine("TD Quote Body Type", absl::StrCat(quote.body.body_type), &output);
  AppendLine("Size", absl::StrCat(quote.body.size), &output);
  AppendHexLine("TEE TCB SVN", body.tee_tcb_svn, &output);
  AppendHexLine("MRSEAM", body.mrseam, &output);
  AppendHexLine("MRSIGNERSEAM", body.mrsignerseam, &output);
  AppendHexLine("Seam Attributes", body.seam_attributes, &output);
  AppendHexLine("TD Attributes", body.td_attributes, &output);
  absl::StrAppend(&output, "  \t",
                  FormatTdAttributes(DecomposeTdAttributes(body.td_attributes)),
                  "\n");
  AppendHexLine("XFAM", body.xfam, &output);
  AppendHexLine("MRTD", body.mrtd, &output);
  AppendHexLine("MRCONFIGID", body.mrconfigid, &output);
  AppendHexLine("MROWNER", body.mrowner, &output);
  AppendHexLine("MROWNERCONFIG", body.mrownerconfig, &output);
  AppendHexLine("RTMR0", body.rtmr0, &output);
  AppendHexLine("RTMR1", body.rtmr1, &output);
  AppendHexLine("RTMR2", body.rtmr2, &output);
  AppendHexLine("RTMR3", body.rtmr3, &output);
  AppendHexLine("Report Data", body.report_data, &output);
  AppendHexLine("TEE TCB SVN 2", body.tee_tcb_svn_2, &output);
  AppendHexLine("MRSERVICETD", body.mrservicetd, &output);
  return output;
}

}  // namespace tdquote
