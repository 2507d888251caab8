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

#include "tdquote/quote/quote_proto_util.h"

#include <string>

#include "tdquote/util/byte_container_util.h"
#include "tdquote/util/byte_container_view.h"
#include "tdquote/util/hex_util.h"

namespace tdquote {
namespace {

std::string ToBytes(ByteContainerView view) {
  return CopyToByteContainer<std::string>(view);
}

TeeTypeProto TeeTypeToProto(TeeType tee_type) {
  return tee_type == TeeType::TDX ? TEE_TYPE_TDX : TEE_TYPE_SGX;
}

}  // namespace

TdAttributesProto TdAttributesToProto(const TdAttributes &attributes) {
  TdAttributesProto proto;
  proto.mutable_tud()->set_debug(attributes.tud.debug);
  proto.mutable_tud()->set_reserved_bits(attributes.tud.reserved);

  TdAttributesProto::Sec *sec = proto.mutable_sec();
  sec->set_reserved_bits(attributes.sec.reserved);
  sec->set_sept_ve_disable(attributes.sec.sept_ve_disable);
  sec->set_pks(attributes.sec.pks);
  sec->set_kl(attributes.sec.kl);

  proto.mutable_other()->set_reserved_bits(attributes.other.reserved);
  proto.mutable_other()->set_perfmon(attributes.other.perfmon);
  return proto;
}

QuoteProto QuoteToProto(const Quote &quote) {
  QuoteProto proto;

  const QuoteHeader &header = quote.header;
  QuoteHeaderProto *header_proto = proto.mutable_header();
  header_proto->set_version(header.version);
  header_proto->set_attestation_key_type(header.attestation_key_type);
  header_proto->set_tee_type(TeeTypeToProto(header.tee_type));
  header_proto->set_reserved1(ToBytes(header.reserved1));
  header_proto->set_reserved2(ToBytes(header.reserved2));
  header_proto->set_qe_vendor_id(BytesToUuidString(header.qe_vendor_id));
  header_proto->set_user_data(ToBytes(header.user_data));

  QuoteBodyProto *body_proto = proto.mutable_body();
  body_proto->set_body_type(quote.body.body_type);
  body_proto->set_size(quote.body.size);

  const TdQuoteBody &body = quote.body.td_quote_body;
  TdQuoteBodyProto *td_body = body_proto->mutable_td_quote_body();
  td_body->set_tee_tcb_svn(ToBytes(body.tee_tcb_svn));
  td_body->set_mrseam(ToBytes(body.mrseam));
  td_body->set_mrsignerseam(ToBytes(body.mrsignerseam));
  td_body->set_seam_attributes(ToBytes(body.seam_attributes));
  td_body->set_td_attributes(ToBytes(body.td_attributes));
  td_body->set_xfam(ToBytes(body.xfam));
  td_body->set_mrtd(ToBytes(body.mrtd));
  td_body->set_mrconfigid(ToBytes(body.mrconfigid));
  td_body->set_mrowner(ToBytes(body.mrowner));
  td_body->set_mrownerconfig(ToBytes(body.mrownerconfig));
  td_body->set_rtmr0(ToBytes(body.rtmr0));
  td_body->set_rtmr1(ToBytes(body.rtmr1));
  td_body->set_rtmr2(ToBytes(body.rtmr2));
  td_body->set_rtmr3(ToBytes(body.rtmr3));
  td_body->set_report_data(ToBytes(body.report_data));
  td_body->set_tee_tcb_svn_2(ToBytes(body.tee_tcb_svn_2));
  td_body->set_mrservicetd(ToBytes(body.mrservicetd));
  *td_body->mutable_td_attributes_fields() =
      TdAttributesToProto(DecomposeTdAttributes(body.td_attributes));

  proto.set_trailing_bytes(quote.trailing_bytes);
  return proto;
}

}  // namespace tdquote
