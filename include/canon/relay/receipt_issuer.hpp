#pragma once

#include <canon/execution/anchor_engine.hpp>
#include <canon/schema/call_result.hpp>
#include <canon/schema/events.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/token/receipt_token.hpp>

#include <cstdint>

namespace canon::relay {

/// Content hash of the receipt issued for an anchor: BLAKE3 over the SCALE
/// encoding of the anchored digests, assurance level and timestamp.
canon::schema::digest_t receipt_content_hash(
    const canon::schema::anchored_event_t& event);

struct receipt_issuer_options final {
  canon::schema::principal_t minter{};
  bool auto_mint{true};
};

struct issuance_stats final {
  uint64_t minted{};
  uint64_t duplicates{};
  uint64_t failures{};
  uint64_t skipped{};
};

/// Mints a claim receipt for every committed anchor.
///
/// The receipt goes to the anchor's authorized principal. A duplicate
/// content hash resolves to the already-issued token; any other rejection is
/// logged and counted. The attached engine must outlive the issuer; the
/// issuer detaches itself on destruction.
class receipt_issuer final {
 public:
  receipt_issuer(canon::token::receipt_token& token,
                 const receipt_issuer_options& options);
  ~receipt_issuer();

  receipt_issuer(const receipt_issuer&) = delete;
  receipt_issuer& operator=(const receipt_issuer&) = delete;
  receipt_issuer(receipt_issuer&&) = delete;
  receipt_issuer& operator=(receipt_issuer&&) = delete;

  /// Subscribe to committed events of engine, replacing any earlier
  /// attachment.
  void attach(canon::execution::anchor_engine& engine);
  void detach();
  bool attached() const;

  void on_event(const canon::schema::event_record_t& record);

  /// Mint (or find) the receipt for one anchor.
  canon::schema::call_result<canon::schema::token_id_t> issue(
      const canon::schema::anchored_event_t& event);

  void set_auto_mint(bool enabled);
  bool auto_mint() const;
  const issuance_stats& stats() const;

 private:
  canon::token::receipt_token& token_;
  canon::execution::anchor_engine* engine_{};
  canon::execution::subscription_id_t subscription_{};
  canon::schema::principal_t minter_;
  bool auto_mint_{true};
  issuance_stats stats_{};
};

}  // namespace canon::relay
