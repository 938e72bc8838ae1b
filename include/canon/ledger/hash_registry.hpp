#pragma once

#include <canon/schema/primitives.hpp>

#include <cstdint>
#include <unordered_map>

namespace canon::ledger {

/// Point-lookup index of anchored digests.
///
/// Re-recording a digest overwrites its block height (last write wins); the
/// append-only history lives in the event log, not here. Entries are never
/// removed.
class hash_registry final {
 public:
  using entries_t = std::unordered_map<canon::schema::digest_t,
                                       uint64_t,
                                       canon::schema::hash32_hasher_t>;

  void record(const canon::schema::digest_t& digest, uint64_t block_height);

  bool is_anchored(const canon::schema::digest_t& digest) const;

  /// Block height of the most recent record, or 0 when never anchored.
  uint64_t last_anchor_block(const canon::schema::digest_t& digest) const;

  std::size_t size() const;
  const entries_t& entries() const;

 private:
  entries_t anchors_;
};

}  // namespace canon::ledger
