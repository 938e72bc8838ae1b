#pragma once

#include <canon/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <vector>

// Schema type: anchor fields.
// The four digests a relayer anchors for one deletion event. Each field must
// carry a distinct digest; reusing one value for several fields destroys the
// audit trail.
namespace canon::schema {

inline constexpr uint8_t kMaxAssuranceLevel = 2;

struct anchor_fields_t final {
  digest_t warrant_digest{};
  digest_t attestation_digest{};
  digest_t subject_tag{};
  digest_t controller_did_hash{};
};

/// The digests of fields in field order.
std::vector<digest_t> anchored_digests(const anchor_fields_t& fields);

/// True when no two digests are equal.
bool digests_distinct(std::span<const digest_t> digests);

}  // namespace canon::schema
