#pragma once

#include <canon/schema/primitives.hpp>

#include <cstdint>
#include <unordered_map>

namespace canon::ledger {

class anchor_authorizer;

/// Per-signer meta-transaction counters.
///
/// Keys are always the principal derived from a verified signature, never
/// the account that submitted the call. `advance` is reachable only from
/// anchor_authorizer, after it has verified the signature and matched the
/// nonce, so nothing else can move a signer's counter.
class nonce_authority final {
 public:
  using entries_t = std::unordered_map<canon::schema::principal_t,
                                       uint64_t,
                                       canon::schema::hash32_hasher_t>;

  /// Current nonce for principal; 0 for principals never seen.
  uint64_t current_nonce(const canon::schema::principal_t& principal) const;

  const entries_t& entries() const;

  /// Reinstall persisted counters at startup.
  void restore(const canon::schema::principal_t& principal, uint64_t nonce);

 private:
  friend class anchor_authorizer;

  /// Increment and return the new nonce.
  uint64_t advance(const canon::schema::principal_t& principal);

  entries_t nonces_;
};

}  // namespace canon::ledger
