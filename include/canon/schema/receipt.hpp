#pragma once

#include <canon/schema/primitives.hpp>
#include <cstdint>

// Schema type: receipt.
// A live soulbound claim receipt. Keyed by token id; the content hash is
// unique among live receipts.
namespace canon::schema {

template <uint16_t Version>
struct receipt;

template <>
struct receipt<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  digest_t content_hash{};
  principal_t owner{};
  timestamp_milliseconds_t minted_at{};
  principal_t original_minter{};
};

using receipt_t = receipt<1>;

}  // namespace canon::schema
