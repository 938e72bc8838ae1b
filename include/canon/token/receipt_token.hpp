#pragma once

#include <canon/execution/block_context.hpp>
#include <canon/execution/event_log.hpp>
#include <canon/execution/reentrancy_guard.hpp>
#include <canon/ledger/access_control.hpp>
#include <canon/schema/call_result.hpp>
#include <canon/schema/events.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/schema/receipt.hpp>
#include <canon/schema/role_id.hpp>
#include <canon/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace canon::token {

inline constexpr auto kReceiptCodespace = std::string_view{"canon.receipt"};

struct receipt_token_options final {
  std::string name{"Mask Receipt"};
  std::string symbol{"MASKR"};
  canon::schema::principal_t admin{};
  bool minting_enabled{false};
};

/// Soulbound claim receipts.
///
/// Each live receipt binds one content hash to one owner. Token ids are
/// assigned from a counter that never rewinds, so a burned id is never
/// reissued; active supply is tracked separately as minted minus burned.
/// Receipts cannot change hands: every transfer or approval entry point
/// fails with transfers_disabled.
class receipt_token final {
 public:
  receipt_token(canon::storage::rocksdb_storage_t& storage,
                const receipt_token_options& options);

  canon::schema::call_result<> begin_block(
      uint64_t height,
      canon::schema::timestamp_milliseconds_t timestamp);
  canon::schema::call_result<canon::storage::committed_state> commit();

  canon::schema::call_result<canon::schema::token_id_t> mint(
      const canon::schema::principal_t& caller,
      const canon::schema::principal_t& to,
      const canon::schema::digest_t& content_hash);

  /// Owner or admin only.
  canon::schema::call_result<> burn(const canon::schema::principal_t& caller,
                                    canon::schema::token_id_t token_id);

  canon::schema::call_result<> toggle_minting(
      const canon::schema::principal_t& caller,
      bool enabled);
  canon::schema::call_result<> pause(const canon::schema::principal_t& caller);
  canon::schema::call_result<> unpause(
      const canon::schema::principal_t& caller);

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

  canon::schema::call_result<> transfer_from(
      const canon::schema::principal_t& caller,
      const canon::schema::principal_t& from,
      const canon::schema::principal_t& to,
      canon::schema::token_id_t token_id) const;
  canon::schema::call_result<> safe_transfer_from(
      const canon::schema::principal_t& caller,
      const canon::schema::principal_t& from,
      const canon::schema::principal_t& to,
      canon::schema::token_id_t token_id) const;
  canon::schema::call_result<> approve(
      const canon::schema::principal_t& caller,
      const canon::schema::principal_t& spender,
      canon::schema::token_id_t token_id) const;
  canon::schema::call_result<> set_approval_for_all(
      const canon::schema::principal_t& caller,
      const canon::schema::principal_t& operator_account,
      bool approved) const;

  canon::execution::subscription_id_t subscribe(
      canon::execution::event_subscriber_t subscriber);
  void unsubscribe(canon::execution::subscription_id_t id);

  const std::string& name() const;
  const std::string& symbol() const;
  bool is_minted(const canon::schema::digest_t& content_hash) const;
  /// Live token carrying content_hash.
  std::optional<canon::schema::token_id_t> token_of(
      const canon::schema::digest_t& content_hash) const;
  canon::schema::call_result<canon::schema::digest_t> content_hash(
      canon::schema::token_id_t token_id) const;
  canon::schema::call_result<canon::schema::principal_t> owner_of(
      canon::schema::token_id_t token_id) const;
  canon::schema::call_result<canon::schema::timestamp_milliseconds_t>
  mint_timestamp(canon::schema::token_id_t token_id) const;
  canon::schema::call_result<canon::schema::principal_t> original_minter(
      canon::schema::token_id_t token_id) const;
  uint64_t balance_of(const canon::schema::principal_t& owner) const;
  uint64_t active_supply() const;
  uint64_t total_minted() const;
  uint64_t total_burned() const;
  bool minting_enabled() const;
  bool paused() const;
  bool has_role(canon::schema::role_id_t role,
                const canon::schema::principal_t& account) const;
  canon::storage::committed_state last_committed() const;
  std::vector<canon::schema::event_record_t> events() const;

 private:
  canon::schema::call_result<> admit_call(
      const canon::execution::reentrancy_guard::scope& entry) const;
  std::optional<canon::schema::receipt_t> find(
      canon::schema::token_id_t token_id) const;
  canon::schema::call_result<> record_role_change(
      const canon::schema::call_result<bool>& changed,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account,
      const canon::schema::principal_t& sender,
      bool granted);

  std::vector<canon::storage::key_value_entry_t> export_state() const;
  void load_persisted_state(const receipt_token_options& options);

  mutable std::recursive_mutex mutex_;
  canon::storage::rocksdb_storage_t& storage_;
  canon::execution::reentrancy_guard guard_;
  canon::ledger::access_control roles_;
  canon::execution::event_log events_;
  std::vector<canon::schema::event_record_t> committed_events_;
  canon::execution::block_context block_{};
  canon::storage::committed_state last_committed_{};
  std::string name_;
  std::string symbol_;
  std::map<canon::schema::token_id_t, canon::schema::receipt_t> receipts_;
  std::unordered_map<canon::schema::digest_t,
                     canon::schema::token_id_t,
                     canon::schema::hash32_hasher_t>
      by_content_;
  std::unordered_map<canon::schema::principal_t,
                     uint64_t,
                     canon::schema::hash32_hasher_t>
      balances_;
  canon::schema::token_id_t next_token_id_{1};
  uint64_t total_minted_{};
  uint64_t total_burned_{};
  bool minting_enabled_{false};
  bool paused_{false};
};

}  // namespace canon::token
