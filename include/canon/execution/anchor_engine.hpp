#pragma once

#include <canon/execution/block_context.hpp>
#include <canon/execution/event_log.hpp>
#include <canon/execution/reentrancy_guard.hpp>
#include <canon/ledger/access_control.hpp>
#include <canon/ledger/anchor_authorizer.hpp>
#include <canon/ledger/fee_ledger.hpp>
#include <canon/ledger/hash_registry.hpp>
#include <canon/ledger/nonce_authority.hpp>
#include <canon/ledger/signature_verifier.hpp>
#include <canon/schema/anchor_fields.hpp>
#include <canon/schema/anchor_requests.hpp>
#include <canon/schema/call_result.hpp>
#include <canon/schema/events.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/schema/replay_result.hpp>
#include <canon/schema/role_id.hpp>
#include <canon/schema/signed_anchor_request.hpp>
#include <canon/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace canon::execution {

inline constexpr auto kAnchorCodespace = std::string_view{"canon.anchor"};

/// 0.001 of an 18-decimal native unit.
inline const auto kDefaultBaseFee =
    canon::schema::amount_t{1'000'000'000'000'000ULL};

struct anchor_engine_options final {
  canon::schema::signing_domain_t domain{};
  canon::schema::principal_t admin{};
  canon::schema::principal_t foundation_treasury{};
  canon::schema::principal_t implementer_treasury{};
  canon::schema::amount_t base_fee{kDefaultBaseFee};
};

using treasuries_t =
    std::pair<canon::schema::principal_t, canon::schema::principal_t>;

/// Anchoring state machine of the Canon registry.
///
/// Owns the hash registry, signer nonces, fee ledger and role table, and
/// drives every anchor through authorize, record, deposit and emit. A call
/// either applies all of its effects or none of them. Mutating entry points
/// share one reentrancy guard, so a nested call made from inside a value
/// transfer is rejected with reentrant_call.
///
/// The host opens a block with begin_block, submits calls, then commits;
/// commit persists summary state and events and hands committed events to
/// subscribers.
class anchor_engine final {
 public:
  /// Load committed state from storage, or install options on a fresh
  /// database. Once state is committed only the signing domain is taken
  /// from options.
  anchor_engine(canon::storage::rocksdb_storage_t& storage,
                const anchor_engine_options& options);

  canon::schema::call_result<> begin_block(
      uint64_t height,
      canon::schema::timestamp_milliseconds_t timestamp);

  /// Persist summary state and the block's events, then publish the events.
  canon::schema::call_result<canon::storage::committed_state> commit();

  /// Direct anchor by a relayer-role caller.
  canon::schema::call_result<> anchor(
      const canon::schema::principal_t& caller,
      const canon::schema::anchor_fields_t& fields,
      uint8_t assurance_level,
      const canon::schema::amount_t& payment);

  /// Meta-transaction anchor. Any executor may submit; the anchor is
  /// attributed to the verified signer, which is returned.
  canon::schema::call_result<canon::schema::principal_t> anchor_meta(
      const canon::schema::principal_t& executor,
      const canon::schema::signed_anchor_request_t& request,
      const canon::schema::amount_t& payment);

  canon::schema::call_result<> anchor_warrant(
      const canon::schema::principal_t& caller,
      const canon::schema::warrant_anchor_t& request,
      const canon::schema::amount_t& payment);
  canon::schema::call_result<> anchor_attestation(
      const canon::schema::principal_t& caller,
      const canon::schema::attestation_anchor_t& request,
      const canon::schema::amount_t& payment);
  canon::schema::call_result<> anchor_receipt(
      const canon::schema::principal_t& caller,
      const canon::schema::receipt_anchor_t& request,
      const canon::schema::amount_t& payment);

  canon::schema::call_result<canon::schema::amount_t> withdraw(
      const canon::schema::principal_t& caller);

  /// Admin sweep of everything held; permitted while paused.
  canon::schema::call_result<canon::schema::amount_t> emergency_withdraw(
      const canon::schema::principal_t& caller);

  canon::schema::call_result<> pause(const canon::schema::principal_t& caller);
  canon::schema::call_result<> unpause(
      const canon::schema::principal_t& caller);

  canon::schema::call_result<> set_base_fee(
      const canon::schema::principal_t& caller,
      const canon::schema::amount_t& fee);
  canon::schema::call_result<> set_treasuries(
      const canon::schema::principal_t& caller,
      const canon::schema::principal_t& foundation,
      const canon::schema::principal_t& implementer);

  canon::schema::call_result<> grant_role(
      const canon::schema::principal_t& caller,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account);
  canon::schema::call_result<> revoke_role(
      const canon::schema::principal_t& caller,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account);
  canon::schema::call_result<> renounce_role(
      const canon::schema::principal_t& caller,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account);

  /// Host hook that moves value out of the ledger's custody. The default
  /// accepts every transfer.
  void set_value_transfer(canon::ledger::value_transfer_t transfer);
  void set_signature_verifier(canon::ledger::signature_verifier_t verifier);
  subscription_id_t subscribe(event_subscriber_t subscriber);
  void unsubscribe(subscription_id_t id);

  bool is_anchored(const canon::schema::digest_t& digest) const;
  uint64_t last_anchor_block(const canon::schema::digest_t& digest) const;
  uint64_t current_nonce(const canon::schema::principal_t& principal) const;
  canon::schema::amount_t pending_balance(
      const canon::schema::principal_t& principal) const;
  uint64_t total_anchors() const;
  canon::schema::amount_t total_fees_collected() const;
  canon::schema::amount_t base_fee() const;
  bool paused() const;
  treasuries_t treasuries() const;
  bool has_role(canon::schema::role_id_t role,
                const canon::schema::principal_t& account) const;
  canon::schema::amount_t held_balance() const;
  canon::schema::amount_t total_deposited() const;
  canon::schema::amount_t total_withdrawn() const;
  const canon::schema::signing_domain_t& domain() const;
  block_context current_block() const;
  canon::storage::committed_state last_committed() const;

  /// Committed events followed by the current block's staged events.
  std::vector<canon::schema::event_record_t> events() const;

  /// Rebuild summary state from the persisted event log and compare it with
  /// the committed summary state.
  canon::schema::replay_result_t replay_events() const;

 private:
  /// Checks shared by every anchor path; mutates nothing.
  canon::schema::call_result<> validate_anchor(
      const reentrancy_guard::scope& entry,
      const std::vector<canon::schema::digest_t>& digests,
      uint8_t assurance_level,
      const canon::schema::amount_t& payment) const;

  /// Apply the effects of an authorized anchor.
  void settle_anchor(const std::vector<canon::schema::digest_t>& digests,
                     const canon::schema::amount_t& payment);

  canon::schema::call_result<> reject_if_reentrant(
      const reentrancy_guard::scope& entry) const;
  /// Reentrancy and open-block checks for mutating calls.
  canon::schema::call_result<> admit_call(
      const reentrancy_guard::scope& entry) const;
  canon::schema::call_result<> record_role_change(
      const canon::schema::call_result<bool>& changed,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account,
      const canon::schema::principal_t& sender,
      bool granted);

  std::vector<canon::storage::key_value_entry_t> export_state() const;
  void load_persisted_state(const anchor_engine_options& options);

  mutable std::recursive_mutex mutex_;
  canon::storage::rocksdb_storage_t& storage_;
  reentrancy_guard guard_;
  canon::ledger::hash_registry registry_;
  canon::ledger::nonce_authority nonces_;
  canon::ledger::access_control roles_;
  canon::ledger::anchor_authorizer authorizer_;
  canon::ledger::fee_ledger fees_;
  canon::ledger::value_transfer_t value_transfer_;
  event_log events_;
  std::vector<canon::schema::event_record_t> committed_events_;
  block_context block_{};
  canon::storage::committed_state last_committed_{};
  canon::schema::amount_t base_fee_{kDefaultBaseFee};
  canon::schema::amount_t total_fees_collected_{};
  uint64_t total_anchors_{};
  bool paused_{false};
};

}  // namespace canon::execution
