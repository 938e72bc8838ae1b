#include <canon/ledger/hash_registry.hpp>

namespace canon::ledger {

void hash_registry::record(const canon::schema::digest_t& digest,
                           const uint64_t block_height) {
  anchors_.insert_or_assign(digest, block_height);
}

bool hash_registry::is_anchored(const canon::schema::digest_t& digest) const {
  return anchors_.contains(digest);
}

uint64_t hash_registry::last_anchor_block(
    const canon::schema::digest_t& digest) const {
  auto it = anchors_.find(digest);
  if (it == std::end(anchors_)) {
    return 0;
  }
  return it->second;
}

std::size_t hash_registry::size() const {
  return anchors_.size();
}

const hash_registry::entries_t& hash_registry::entries() const {
  return anchors_;
}

}  // namespace canon::ledger
