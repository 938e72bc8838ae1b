#include <canon/common/critical.hpp>
#include <canon/schema/encoding/scale/encoder.hpp>
#include <canon/schema/encoding/scale/rows.hpp>
#include <canon/schema/key/state_keys.hpp>
#include <canon/storage/state_root.hpp>
#include <canon/token/receipt_token.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <tuple>
#include <utility>

using namespace canon::schema;
using namespace canon::schema::key;

namespace canon::token {

namespace {

using encoder_t = encoding::scale_encoder_t;
using canon::execution::reentrancy_guard;

using meta_tuple_t =
    std::tuple<std::string, std::string, uint64_t, uint64_t, uint64_t, bool, bool, uint64_t>;

call_result<> transfers_disabled() {
  return make_failure(error_code::transfers_disabled, kReceiptCodespace,
                      "receipts are soulbound and cannot be transferred");
}

call_result<> unknown_token(const token_id_t token_id) {
  return make_failure(error_code::unknown_token, kReceiptCodespace,
                      fmt::format("token {} does not exist", token_id));
}

}  // namespace

receipt_token::receipt_token(canon::storage::rocksdb_storage_t& storage,
                             const receipt_token_options& options)
    : storage_{storage},
      roles_{options.admin},
      name_{options.name},
      symbol_{options.symbol},
      minting_enabled_{options.minting_enabled} {
  load_persisted_state(options);
}

call_result<> receipt_token::begin_block(
    const uint64_t height,
    const timestamp_milliseconds_t timestamp) {
  auto lock = std::scoped_lock{mutex_};
  if (height <= block_.height) {
    return make_failure(error_code::invalid_block, kReceiptCodespace,
                        fmt::format("block height {} does not follow {}",
                                    height, block_.height));
  }
  block_ = canon::execution::block_context{.height = height,
                                           .timestamp = timestamp};
  return make_success();
}

call_result<canon::storage::committed_state> receipt_token::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return forward_failure<canon::storage::committed_state>(allowed);
  }

  auto batch = canon::storage::commit_batch{};
  batch.checkpoint_key = make_bytes(kReceiptCheckpointKey);
  batch.state_prefix = make_bytes(kReceiptStatePrefix);
  batch.state_rows = export_state();
  batch.checkpoint = canon::storage::committed_state{
      .height = block_.height,
      .state_root = canon::storage::seal_state_rows(batch.state_rows)};

  auto records = events_.take_pending();
  for (const auto& record : records) {
    batch.appended_rows.emplace_back(
        make_sequence_key(kReceiptEventPrefix, record.sequence),
        encoding::encode_event_record(record));
  }

  storage_.commit(batch);
  last_committed_ = batch.checkpoint;
  committed_events_.insert(std::end(committed_events_), std::begin(records),
                           std::end(records));
  spdlog::info("Committed receipt state at height {} ({} live receipts)",
               last_committed_.height, receipts_.size());

  events_.publish(records);
  return make_success(last_committed_);
}

call_result<token_id_t> receipt_token::mint(const principal_t& caller,
                                            const principal_t& to,
                                            const digest_t& content_hash) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return forward_failure<token_id_t>(allowed);
  }
  if (paused_) {
    return make_failure<token_id_t>(error_code::enforced_pause,
                                    kReceiptCodespace, "receipts are paused");
  }
  if (!minting_enabled_) {
    return make_failure<token_id_t>(error_code::minting_disabled,
                                    kReceiptCodespace, "minting is disabled");
  }
  if (auto allowed = roles_.require(role_id_t::minter, caller); !allowed.ok()) {
    return forward_failure<token_id_t>(allowed);
  }
  if (is_zero(to)) {
    return make_failure<token_id_t>(error_code::zero_recipient,
                                    kReceiptCodespace, "recipient is zero");
  }
  if (is_zero(content_hash)) {
    return make_failure<token_id_t>(error_code::invalid_content_hash,
                                    kReceiptCodespace, "content hash is zero");
  }
  if (auto existing = by_content_.find(content_hash);
      existing != std::end(by_content_)) {
    return make_failure<token_id_t>(
        error_code::duplicate_content_hash, kReceiptCodespace,
        fmt::format("content hash {} already minted as token {}",
                    to_hex(content_hash), existing->second));
  }

  auto token_id = next_token_id_++;
  auto receipt = receipt_t{};
  receipt.token_id = token_id;
  receipt.content_hash = content_hash;
  receipt.owner = to;
  receipt.minted_at = block_.timestamp;
  receipt.original_minter = caller;
  receipts_.emplace(token_id, receipt);
  by_content_.emplace(content_hash, token_id);
  ++balances_[to];
  ++total_minted_;

  events_.append(block_.height,
                 receipt_minted_event_t{.token_id = token_id,
                                        .content_hash = content_hash,
                                        .to = to,
                                        .minter = caller,
                                        .timestamp = block_.timestamp});
  spdlog::debug("Minted receipt {} for {}", token_id, to_hex(to));
  return make_success(token_id);
}

call_result<> receipt_token::burn(const principal_t& caller,
                                  const token_id_t token_id) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (paused_) {
    return make_failure(error_code::enforced_pause, kReceiptCodespace,
                        "receipts are paused");
  }
  auto it = receipts_.find(token_id);
  if (it == std::end(receipts_)) {
    return unknown_token(token_id);
  }
  auto receipt = it->second;
  if (caller != receipt.owner && !roles_.has_role(role_id_t::admin, caller)) {
    return make_failure(error_code::unauthorized, kReceiptCodespace,
                        "only the owner or an admin may burn a receipt");
  }

  receipts_.erase(it);
  by_content_.erase(receipt.content_hash);
  if (auto balance = balances_.find(receipt.owner);
      balance != std::end(balances_) && --balance->second == 0) {
    balances_.erase(balance);
  }
  ++total_burned_;

  events_.append(block_.height,
                 receipt_burned_event_t{.token_id = token_id,
                                        .content_hash = receipt.content_hash,
                                        .owner = receipt.owner,
                                        .burner = caller,
                                        .timestamp = block_.timestamp});
  spdlog::debug("Burned receipt {}", token_id);
  return make_success();
}

call_result<> receipt_token::toggle_minting(const principal_t& caller,
                                            const bool enabled) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  minting_enabled_ = enabled;
  events_.append(block_.height,
                 minting_toggled_event_t{.enabled = enabled, .sender = caller});
  spdlog::info("Receipt minting {} by {}", enabled ? "enabled" : "disabled",
               to_hex(caller));
  return make_success();
}

call_result<> receipt_token::pause(const principal_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  if (paused_) {
    return make_failure(error_code::enforced_pause, kReceiptCodespace,
                        "receipts are already paused");
  }
  paused_ = true;
  events_.append(block_.height,
                 pause_changed_event_t{.account = caller, .paused = true});
  spdlog::warn("Receipts paused by {}", to_hex(caller));
  return make_success();
}

call_result<> receipt_token::unpause(const principal_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  if (!paused_) {
    return make_failure(error_code::expected_pause, kReceiptCodespace,
                        "receipts are not paused");
  }
  paused_ = false;
  events_.append(block_.height,
                 pause_changed_event_t{.account = caller, .paused = false});
  spdlog::info("Receipts unpaused by {}", to_hex(caller));
  return make_success();
}

call_result<> receipt_token::grant_role(const principal_t& caller,
                                        const role_id_t role,
                                        const principal_t& account) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  return record_role_change(roles_.grant_role(caller, role, account), role,
                            account, caller, true);
}

call_result<> receipt_token::revoke_role(const principal_t& caller,
                                         const role_id_t role,
                                         const principal_t& account) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  return record_role_change(roles_.revoke_role(caller, role, account), role,
                            account, caller, false);
}

call_result<> receipt_token::renounce_role(const principal_t& caller,
                                           const role_id_t role,
                                           const principal_t& account) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  return record_role_change(roles_.renounce_role(caller, role, account), role,
                            account, caller, false);
}

call_result<> receipt_token::transfer_from(const principal_t&,
                                           const principal_t&,
                                           const principal_t&,
                                           const token_id_t) const {
  return transfers_disabled();
}

call_result<> receipt_token::safe_transfer_from(const principal_t&,
                                                const principal_t&,
                                                const principal_t&,
                                                const token_id_t) const {
  return transfers_disabled();
}

call_result<> receipt_token::approve(const principal_t&,
                                     const principal_t&,
                                     const token_id_t) const {
  return transfers_disabled();
}

call_result<> receipt_token::set_approval_for_all(const principal_t&,
                                                  const principal_t&,
                                                  const bool) const {
  return transfers_disabled();
}

canon::execution::subscription_id_t receipt_token::subscribe(
    canon::execution::event_subscriber_t subscriber) {
  auto lock = std::scoped_lock{mutex_};
  return events_.subscribe(std::move(subscriber));
}

void receipt_token::unsubscribe(const canon::execution::subscription_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  events_.unsubscribe(id);
}

const std::string& receipt_token::name() const {
  return name_;
}

const std::string& receipt_token::symbol() const {
  return symbol_;
}

bool receipt_token::is_minted(const digest_t& content_hash) const {
  auto lock = std::scoped_lock{mutex_};
  return by_content_.contains(content_hash);
}

std::optional<token_id_t> receipt_token::token_of(
    const digest_t& content_hash) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = by_content_.find(content_hash);
  if (it == std::end(by_content_)) {
    return std::nullopt;
  }
  return it->second;
}

call_result<digest_t> receipt_token::content_hash(
    const token_id_t token_id) const {
  auto receipt = find(token_id);
  if (!receipt) {
    return forward_failure<digest_t>(unknown_token(token_id));
  }
  return make_success(receipt->content_hash);
}

call_result<principal_t> receipt_token::owner_of(
    const token_id_t token_id) const {
  auto receipt = find(token_id);
  if (!receipt) {
    return forward_failure<principal_t>(unknown_token(token_id));
  }
  return make_success(receipt->owner);
}

call_result<timestamp_milliseconds_t> receipt_token::mint_timestamp(
    const token_id_t token_id) const {
  auto receipt = find(token_id);
  if (!receipt) {
    return forward_failure<timestamp_milliseconds_t>(unknown_token(token_id));
  }
  return make_success(receipt->minted_at);
}

call_result<principal_t> receipt_token::original_minter(
    const token_id_t token_id) const {
  auto receipt = find(token_id);
  if (!receipt) {
    return forward_failure<principal_t>(unknown_token(token_id));
  }
  return make_success(receipt->original_minter);
}

uint64_t receipt_token::balance_of(const principal_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(owner);
  return it == std::end(balances_) ? 0 : it->second;
}

uint64_t receipt_token::active_supply() const {
  auto lock = std::scoped_lock{mutex_};
  return total_minted_ - total_burned_;
}

uint64_t receipt_token::total_minted() const {
  auto lock = std::scoped_lock{mutex_};
  return total_minted_;
}

uint64_t receipt_token::total_burned() const {
  auto lock = std::scoped_lock{mutex_};
  return total_burned_;
}

bool receipt_token::minting_enabled() const {
  auto lock = std::scoped_lock{mutex_};
  return minting_enabled_;
}

bool receipt_token::paused() const {
  auto lock = std::scoped_lock{mutex_};
  return paused_;
}

bool receipt_token::has_role(const role_id_t role,
                             const principal_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return roles_.has_role(role, account);
}

canon::storage::committed_state receipt_token::last_committed() const {
  auto lock = std::scoped_lock{mutex_};
  return last_committed_;
}

std::vector<event_record_t> receipt_token::events() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = committed_events_;
  const auto& pending = events_.pending();
  out.insert(std::end(out), std::begin(pending), std::end(pending));
  return out;
}

call_result<> receipt_token::admit_call(
    const reentrancy_guard::scope& entry) const {
  if (!entry.acquired()) {
    return make_failure(error_code::reentrant_call, kReceiptCodespace,
                        "call is already in progress");
  }
  if (block_.height <= last_committed_.height) {
    return make_failure(error_code::invalid_block, kReceiptCodespace,
                        "no open block");
  }
  return make_success();
}

std::optional<receipt_t> receipt_token::find(const token_id_t token_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = receipts_.find(token_id);
  if (it == std::end(receipts_)) {
    return std::nullopt;
  }
  return it->second;
}

call_result<> receipt_token::record_role_change(
    const call_result<bool>& changed,
    const role_id_t role,
    const principal_t& account,
    const principal_t& sender,
    const bool granted) {
  if (!changed.ok()) {
    return forward_failure<std::monostate>(changed);
  }
  if (changed.value) {
    events_.append(block_.height,
                   role_changed_event_t{.role = role,
                                        .account = account,
                                        .sender = sender,
                                        .granted = granted});
    spdlog::info("Receipt role {} {} {}", canon::schema::to_string(role),
                 granted ? "granted to" : "revoked from", to_hex(account));
  }
  return make_success();
}

std::vector<canon::storage::key_value_entry_t> receipt_token::export_state()
    const {
  auto encoder = encoder_t{};
  auto rows = std::vector<canon::storage::key_value_entry_t>{};
  for (const auto& [token_id, receipt] : receipts_) {
    rows.emplace_back(make_sequence_key(kReceiptTokenPrefix, token_id),
                      encoding::encode_receipt(receipt));
  }
  for (const auto& [role, account] : roles_.members()) {
    rows.emplace_back(make_role_key(kReceiptRolePrefix, role, account),
                      encoder.encode(true));
  }
  rows.emplace_back(make_bytes(kReceiptMetaKey),
                    encoder.encode(meta_tuple_t{
                        name_, symbol_, next_token_id_, total_minted_,
                        total_burned_, minting_enabled_, paused_,
                        events_.next_sequence()}));
  return rows;
}

void receipt_token::load_persisted_state(const receipt_token_options& options) {
  auto committed =
      storage_.load_committed_state(make_bytes(kReceiptCheckpointKey));
  if (!committed.has_value()) {
    auto minter =
        roles_.grant_role(options.admin, role_id_t::minter, options.admin);
    if (!minter.ok()) {
      canon::common::critical("failed to seat the receipt admin as minter");
    }
    spdlog::info("Initialized receipt token {} ({}), minting {}", name_,
                 symbol_, minting_enabled_ ? "enabled" : "disabled");
    return;
  }

  last_committed_ = *committed;
  block_.height = committed->height;

  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kReceiptTokenPrefix))) {
    auto token_id = try_parse_sequence_key(kReceiptTokenPrefix, key);
    auto receipt =
        encoding::try_decode_receipt(bytes_view_t{value.data(), value.size()});
    if (!token_id || !receipt || receipt->token_id != *token_id) {
      canon::common::critical("corrupt receipt row");
    }
    by_content_.emplace(receipt->content_hash, receipt->token_id);
    ++balances_[receipt->owner];
    receipts_.emplace(*token_id, std::move(*receipt));
  }

  auto members = canon::ledger::access_control::membership_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kReceiptRolePrefix))) {
    auto member = try_parse_role_key(kReceiptRolePrefix, key);
    if (!member) {
      canon::common::critical("corrupt receipt role key");
    }
    members.insert(*member);
  }
  roles_.restore(std::move(members));

  auto raw_meta = storage_.get(make_bytes(kReceiptMetaKey));
  if (!raw_meta.has_value()) {
    canon::common::critical("receipt meta row missing from committed state");
  }
  auto meta = encoder_t{}.try_decode<meta_tuple_t>(
      bytes_view_t{raw_meta->data(), raw_meta->size()});
  if (!meta) {
    canon::common::critical("corrupt receipt meta row");
  }
  auto& [name, symbol, next_token_id, total_minted, total_burned,
         minting_enabled, paused, next_sequence] = *meta;
  name_ = name;
  symbol_ = symbol;
  next_token_id_ = next_token_id;
  total_minted_ = total_minted;
  total_burned_ = total_burned;
  minting_enabled_ = minting_enabled;
  paused_ = paused;
  events_.restore_sequence(next_sequence);

  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kReceiptEventPrefix))) {
    auto record = encoding::try_decode_event_record(
        bytes_view_t{value.data(), value.size()});
    if (!record) {
      canon::common::critical("corrupt receipt event row");
    }
    committed_events_.push_back(std::move(*record));
  }

  spdlog::info("Loaded receipt token at height {} ({} live receipts)",
               last_committed_.height, receipts_.size());
}

}  // namespace canon::token
