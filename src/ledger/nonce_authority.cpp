#include <canon/ledger/nonce_authority.hpp>

namespace canon::ledger {

uint64_t nonce_authority::current_nonce(
    const canon::schema::principal_t& principal) const {
  auto it = nonces_.find(principal);
  if (it == std::end(nonces_)) {
    return 0;
  }
  return it->second;
}

uint64_t nonce_authority::advance(const canon::schema::principal_t& principal) {
  auto& nonce = nonces_[principal];
  return ++nonce;
}

const nonce_authority::entries_t& nonce_authority::entries() const {
  return nonces_;
}

void nonce_authority::restore(const canon::schema::principal_t& principal,
                              const uint64_t nonce) {
  if (nonce == 0) {
    nonces_.erase(principal);
    return;
  }
  nonces_.insert_or_assign(principal, nonce);
}

}  // namespace canon::ledger
