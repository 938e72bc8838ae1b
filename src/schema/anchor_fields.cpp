#include <canon/schema/anchor_fields.hpp>

namespace canon::schema {

std::vector<digest_t> anchored_digests(const anchor_fields_t& fields) {
  return {fields.warrant_digest, fields.attestation_digest, fields.subject_tag,
          fields.controller_did_hash};
}

bool digests_distinct(const std::span<const digest_t> digests) {
  for (std::size_t i = 0; i < digests.size(); ++i) {
    for (std::size_t j = i + 1; j < digests.size(); ++j) {
      if (digests[i] == digests[j]) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace canon::schema
