#pragma once

#include <canon/schema/anchor_fields.hpp>
#include <canon/schema/primitives.hpp>
#include <cstdint>

// Schema type: signed anchor request.
// Meta-transaction payload signed off-chain by the principal the anchor is
// attributed to; any relayer may submit it. Consumed at most once: the
// embedded nonce must equal the signer's current nonce.
namespace canon::schema {

template <uint16_t Version>
struct signed_anchor_request;

template <>
struct signed_anchor_request<1> final {
  uint16_t version{1};
  anchor_fields_t fields{};
  uint8_t assurance_level{};
  uint64_t nonce{};
  timestamp_milliseconds_t deadline{};
  signer_id_t signer{};
  signature_t signature{};
};

using signed_anchor_request_t = signed_anchor_request<1>;

/// Domain separating signatures per chain and per registry instance.
struct signing_domain_t final {
  hash32_t chain_id{};
  hash32_t registry_id{};
};

}  // namespace canon::schema
