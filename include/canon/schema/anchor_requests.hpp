#pragma once

#include <canon/schema/primitives.hpp>
#include <string>

// Schema type: typed anchor requests.
// Relayer submissions for the individual artifacts of a deletion flow. Every
// digest a request carries is recorded in the hash registry; the string ids
// are audit metadata carried on the event only.
namespace canon::schema {

struct warrant_anchor_t final {
  digest_t warrant_hash{};
  digest_t subject_handle_hash{};
  digest_t enterprise_hash{};
  std::string enterprise_id;
  std::string warrant_id;
};

struct attestation_anchor_t final {
  digest_t attestation_hash{};
  digest_t warrant_hash{};
  digest_t enterprise_hash{};
  std::string enterprise_id;
  std::string attestation_id;
};

struct receipt_anchor_t final {
  digest_t receipt_hash{};
  digest_t warrant_hash{};
  digest_t attestation_hash{};
  principal_t subject_wallet{};
};

}  // namespace canon::schema
