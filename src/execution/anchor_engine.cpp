#include <canon/common/critical.hpp>
#include <canon/execution/anchor_engine.hpp>
#include <canon/schema/encoding/scale/encoder.hpp>
#include <canon/schema/encoding/scale/rows.hpp>
#include <canon/schema/key/state_keys.hpp>
#include <canon/storage/state_root.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>
#include <utility>

using namespace canon::schema;
using namespace canon::schema::key;

namespace canon::execution {

namespace {

using encoder_t = encoding::scale_encoder_t;
using encoding::amount_bytes_t;
using encoding::from_amount_bytes;
using encoding::to_amount_bytes;

using meta_tuple_t = std::tuple<bool,
                                amount_bytes_t,
                                hash32_t,
                                hash32_t,
                                uint64_t,
                                amount_bytes_t,
                                amount_bytes_t,
                                amount_bytes_t,
                                amount_bytes_t,
                                uint64_t>;

struct meta_row final {
  bool paused{};
  amount_t base_fee{};
  principal_t foundation{};
  principal_t implementer{};
  uint64_t total_anchors{};
  amount_t total_fees{};
  amount_t held{};
  amount_t deposited{};
  amount_t withdrawn{};
  uint64_t next_sequence{1};
};

meta_row decode_meta(const bytes_view_t& bytes) {
  auto decoded = encoder_t{}.try_decode<meta_tuple_t>(bytes);
  if (!decoded) {
    canon::common::critical("corrupt anchor meta row");
  }
  auto& [paused, base_fee, foundation, implementer, total_anchors, total_fees,
         held, deposited, withdrawn, next_sequence] = *decoded;
  return meta_row{.paused = paused,
                  .base_fee = from_amount_bytes(base_fee),
                  .foundation = foundation,
                  .implementer = implementer,
                  .total_anchors = total_anchors,
                  .total_fees = from_amount_bytes(total_fees),
                  .held = from_amount_bytes(held),
                  .deposited = from_amount_bytes(deposited),
                  .withdrawn = from_amount_bytes(withdrawn),
                  .next_sequence = next_sequence};
}

uint64_t decode_u64(const bytes_t& bytes, std::string_view what) {
  auto decoded = encoder_t{}.try_decode<uint64_t>(
      bytes_view_t{bytes.data(), bytes.size()});
  if (!decoded) {
    canon::common::critical("corrupt {} row", what);
  }
  return *decoded;
}

/// Digests recorded for each anchoring event kind, in recording order.
std::vector<digest_t> recorded_digests(const event_t& event) {
  return std::visit(
      overloaded{
          [](const anchored_event_t& value) -> std::vector<digest_t> {
            return {value.warrant_digest, value.attestation_digest,
                    value.subject_tag, value.controller_did_hash};
          },
          [](const warrant_anchored_event_t& value) -> std::vector<digest_t> {
            return {value.warrant_hash, value.subject_handle_hash,
                    value.enterprise_hash};
          },
          [](const attestation_anchored_event_t& value)
              -> std::vector<digest_t> {
            return {value.attestation_hash, value.warrant_hash,
                    value.enterprise_hash};
          },
          [](const receipt_anchored_event_t& value) -> std::vector<digest_t> {
            return {value.receipt_hash, value.warrant_hash,
                    value.attestation_hash};
          },
          [](const auto&) -> std::vector<digest_t> { return {}; }},
      event);
}

std::optional<amount_t> anchor_fee(const event_t& event) {
  return std::visit(
      overloaded{[](const anchored_event_t& value) -> std::optional<amount_t> {
                   return value.fee;
                 },
                 [](const warrant_anchored_event_t& value)
                     -> std::optional<amount_t> { return value.fee; },
                 [](const attestation_anchored_event_t& value)
                     -> std::optional<amount_t> { return value.fee; },
                 [](const receipt_anchored_event_t& value)
                     -> std::optional<amount_t> { return value.fee; },
                 [](const auto&) -> std::optional<amount_t> {
                   return std::nullopt;
                 }},
      event);
}

}  // namespace

anchor_engine::anchor_engine(canon::storage::rocksdb_storage_t& storage,
                             const anchor_engine_options& options)
    : storage_{storage},
      roles_{options.admin},
      authorizer_{options.domain, nonces_, roles_},
      fees_{options.foundation_treasury, options.implementer_treasury},
      value_transfer_{[](const principal_t& recipient, const amount_t& amount) {
        spdlog::debug("Released {} to {}", canon::schema::to_string(amount),
                      to_hex(recipient));
        return true;
      }},
      base_fee_{options.base_fee} {
  load_persisted_state(options);
}

call_result<> anchor_engine::begin_block(
    const uint64_t height,
    const timestamp_milliseconds_t timestamp) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = reject_if_reentrant(entry); !allowed.ok()) {
    return allowed;
  }
  if (height <= block_.height) {
    return make_failure(error_code::invalid_block, kAnchorCodespace,
                        fmt::format("block height {} does not follow {}",
                                    height, block_.height));
  }
  block_ = block_context{.height = height, .timestamp = timestamp};
  return make_success();
}

call_result<canon::storage::committed_state> anchor_engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = reject_if_reentrant(entry); !allowed.ok()) {
    return forward_failure<canon::storage::committed_state>(allowed);
  }
  if (block_.height <= last_committed_.height) {
    return make_failure<canon::storage::committed_state>(
        error_code::invalid_block, kAnchorCodespace,
        fmt::format("block {} already committed", block_.height));
  }

  auto batch = canon::storage::commit_batch{};
  batch.checkpoint_key = make_bytes(kAnchorCheckpointKey);
  batch.state_prefix = make_bytes(kAnchorStatePrefix);
  batch.state_rows = export_state();
  auto root = canon::storage::seal_state_rows(batch.state_rows);
  batch.checkpoint =
      canon::storage::committed_state{.height = block_.height,
                                      .state_root = root};

  auto records = events_.take_pending();
  for (const auto& record : records) {
    batch.appended_rows.emplace_back(
        make_sequence_key(kAnchorEventPrefix, record.sequence),
        encoding::encode_event_record(record));
  }

  storage_.commit(batch);
  last_committed_ = batch.checkpoint;
  committed_events_.insert(std::end(committed_events_), std::begin(records),
                           std::end(records));
  spdlog::info("Committed anchor state at height {} root {} ({} events)",
               last_committed_.height, to_hex(last_committed_.state_root),
               records.size());

  events_.publish(records);
  return make_success(last_committed_);
}

call_result<> anchor_engine::anchor(const principal_t& caller,
                                    const anchor_fields_t& fields,
                                    const uint8_t assurance_level,
                                    const amount_t& payment) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  auto digests = anchored_digests(fields);
  if (auto valid = validate_anchor(entry, digests, assurance_level, payment);
      !valid.ok()) {
    return valid;
  }
  auto authorized = authorizer_.verify_direct(caller, role_id_t::relayer);
  if (!authorized.ok()) {
    return forward_failure<std::monostate>(authorized);
  }

  settle_anchor(digests, payment);
  events_.append(block_.height,
                 anchored_event_t{.warrant_digest = fields.warrant_digest,
                                  .attestation_digest = fields.attestation_digest,
                                  .principal = authorized.value,
                                  .subject_tag = fields.subject_tag,
                                  .controller_did_hash = fields.controller_did_hash,
                                  .assurance_level = assurance_level,
                                  .timestamp = block_.timestamp,
                                  .fee = payment,
                                  .executor = std::nullopt});
  spdlog::debug("Anchored warrant {} for {}", to_hex(fields.warrant_digest),
                to_hex(authorized.value));
  return make_success();
}

call_result<principal_t> anchor_engine::anchor_meta(
    const principal_t& executor,
    const signed_anchor_request_t& request,
    const amount_t& payment) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  auto digests = anchored_digests(request.fields);
  if (auto valid =
          validate_anchor(entry, digests, request.assurance_level, payment);
      !valid.ok()) {
    return forward_failure<principal_t>(valid);
  }
  // Advances the signer's nonce; nothing after this point can fail.
  auto authorized =
      authorizer_.verify_meta(request, executor, block_.timestamp);
  if (!authorized.ok()) {
    spdlog::debug("Meta anchor from executor {} rejected: {}",
                  to_hex(executor), authorized.log);
    return authorized;
  }

  const auto& fields = request.fields;
  settle_anchor(digests, payment);
  events_.append(block_.height,
                 anchored_event_t{.warrant_digest = fields.warrant_digest,
                                  .attestation_digest = fields.attestation_digest,
                                  .principal = authorized.value,
                                  .subject_tag = fields.subject_tag,
                                  .controller_did_hash = fields.controller_did_hash,
                                  .assurance_level = request.assurance_level,
                                  .timestamp = block_.timestamp,
                                  .fee = payment,
                                  .executor = executor});
  return authorized;
}

call_result<> anchor_engine::anchor_warrant(const principal_t& caller,
                                            const warrant_anchor_t& request,
                                            const amount_t& payment) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  auto digests = std::vector<digest_t>{
      request.warrant_hash, request.subject_handle_hash, request.enterprise_hash};
  if (auto valid = validate_anchor(entry, digests, 0, payment); !valid.ok()) {
    return valid;
  }
  auto authorized = authorizer_.verify_direct(caller, role_id_t::relayer);
  if (!authorized.ok()) {
    return forward_failure<std::monostate>(authorized);
  }

  settle_anchor(digests, payment);
  events_.append(block_.height,
                 warrant_anchored_event_t{
                     .warrant_hash = request.warrant_hash,
                     .subject_handle_hash = request.subject_handle_hash,
                     .enterprise_hash = request.enterprise_hash,
                     .enterprise_id = request.enterprise_id,
                     .warrant_id = request.warrant_id,
                     .submitter = caller,
                     .timestamp = block_.timestamp,
                     .fee = payment});
  return make_success();
}

call_result<> anchor_engine::anchor_attestation(
    const principal_t& caller,
    const attestation_anchor_t& request,
    const amount_t& payment) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  auto digests = std::vector<digest_t>{
      request.attestation_hash, request.warrant_hash, request.enterprise_hash};
  if (auto valid = validate_anchor(entry, digests, 0, payment); !valid.ok()) {
    return valid;
  }
  auto authorized = authorizer_.verify_direct(caller, role_id_t::relayer);
  if (!authorized.ok()) {
    return forward_failure<std::monostate>(authorized);
  }

  settle_anchor(digests, payment);
  events_.append(block_.height,
                 attestation_anchored_event_t{
                     .attestation_hash = request.attestation_hash,
                     .warrant_hash = request.warrant_hash,
                     .enterprise_hash = request.enterprise_hash,
                     .enterprise_id = request.enterprise_id,
                     .attestation_id = request.attestation_id,
                     .submitter = caller,
                     .timestamp = block_.timestamp,
                     .fee = payment});
  return make_success();
}

call_result<> anchor_engine::anchor_receipt(const principal_t& caller,
                                            const receipt_anchor_t& request,
                                            const amount_t& payment) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  auto digests = std::vector<digest_t>{
      request.receipt_hash, request.warrant_hash, request.attestation_hash};
  if (auto valid = validate_anchor(entry, digests, 0, payment); !valid.ok()) {
    return valid;
  }
  if (is_zero(request.subject_wallet)) {
    return make_failure(error_code::zero_recipient, kAnchorCodespace,
                        "receipt subject wallet is zero");
  }
  auto authorized = authorizer_.verify_direct(caller, role_id_t::relayer);
  if (!authorized.ok()) {
    return forward_failure<std::monostate>(authorized);
  }

  settle_anchor(digests, payment);
  events_.append(block_.height,
                 receipt_anchored_event_t{
                     .receipt_hash = request.receipt_hash,
                     .warrant_hash = request.warrant_hash,
                     .attestation_hash = request.attestation_hash,
                     .subject_wallet = request.subject_wallet,
                     .submitter = caller,
                     .timestamp = block_.timestamp,
                     .fee = payment});
  return make_success();
}

call_result<amount_t> anchor_engine::withdraw(const principal_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return forward_failure<amount_t>(allowed);
  }
  if (paused_) {
    return make_failure<amount_t>(error_code::enforced_pause,
                                  kAnchorCodespace, "registry is paused");
  }

  // The hook may replace itself while it runs.
  auto transfer = value_transfer_;
  auto withdrawn = fees_.withdraw(caller, transfer);
  if (!withdrawn.ok()) {
    return withdrawn;
  }
  events_.append(block_.height,
                 withdrawal_event_t{.principal = caller,
                                    .amount = withdrawn.value,
                                    .timestamp = block_.timestamp,
                                    .emergency = false});
  return withdrawn;
}

call_result<amount_t> anchor_engine::emergency_withdraw(
    const principal_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return forward_failure<amount_t>(allowed);
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return forward_failure<amount_t>(allowed);
  }

  auto transfer = value_transfer_;
  auto swept = fees_.emergency_withdraw(caller, transfer);
  if (!swept.ok()) {
    return swept;
  }
  events_.append(block_.height,
                 withdrawal_event_t{.principal = caller,
                                    .amount = swept.value,
                                    .timestamp = block_.timestamp,
                                    .emergency = true});
  return swept;
}

call_result<> anchor_engine::pause(const principal_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  if (paused_) {
    return make_failure(error_code::enforced_pause, kAnchorCodespace,
                        "registry is already paused");
  }
  paused_ = true;
  events_.append(block_.height,
                 pause_changed_event_t{.account = caller, .paused = true});
  spdlog::warn("Registry paused by {}", to_hex(caller));
  return make_success();
}

call_result<> anchor_engine::unpause(const principal_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  if (!paused_) {
    return make_failure(error_code::expected_pause, kAnchorCodespace,
                        "registry is not paused");
  }
  paused_ = false;
  events_.append(block_.height,
                 pause_changed_event_t{.account = caller, .paused = false});
  spdlog::info("Registry unpaused by {}", to_hex(caller));
  return make_success();
}

call_result<> anchor_engine::set_base_fee(const principal_t& caller,
                                          const amount_t& fee) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  base_fee_ = fee;
  events_.append(block_.height,
                 base_fee_changed_event_t{.fee = fee, .sender = caller});
  spdlog::info("Base fee set to {}", canon::schema::to_string(fee));
  return make_success();
}

call_result<> anchor_engine::set_treasuries(const principal_t& caller,
                                            const principal_t& foundation,
                                            const principal_t& implementer) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = reentrancy_guard::scope{guard_};
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (auto allowed = roles_.require(role_id_t::admin, caller); !allowed.ok()) {
    return allowed;
  }
  if (is_zero(foundation) || is_zero(implementer)) {
    return make_failure(error_code::invalid_treasury, kAnchorCodespace,
                        "treasury principal must be non-zero");
  }
  fees_.set_treasuries(foundation, implementer);
  events_.append(block_.height,
                 treasuries_changed_event_t{.foundation = foundation,
                                            .implementer = implementer,
                                            .sender = caller});
  spdlog::info("Treasuries set to foundation {} implementer {}",
               to_hex(foundation), to_hex(implementer));
  return make_success();
}

call_result<> anchor_engine::grant_role(const principal_t& caller,
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

call_result<> anchor_engine::revoke_role(const principal_t& caller,
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

call_result<> anchor_engine::renounce_role(const principal_t& caller,
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

void anchor_engine::set_value_transfer(canon::ledger::value_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  value_transfer_ = std::move(transfer);
}

void anchor_engine::set_signature_verifier(
    canon::ledger::signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  authorizer_.set_signature_verifier(std::move(verifier));
}

subscription_id_t anchor_engine::subscribe(event_subscriber_t subscriber) {
  auto lock = std::scoped_lock{mutex_};
  return events_.subscribe(std::move(subscriber));
}

void anchor_engine::unsubscribe(const subscription_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  events_.unsubscribe(id);
}

bool anchor_engine::is_anchored(const digest_t& digest) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_anchored(digest);
}

uint64_t anchor_engine::last_anchor_block(const digest_t& digest) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.last_anchor_block(digest);
}

uint64_t anchor_engine::current_nonce(const principal_t& principal) const {
  auto lock = std::scoped_lock{mutex_};
  return nonces_.current_nonce(principal);
}

amount_t anchor_engine::pending_balance(const principal_t& principal) const {
  auto lock = std::scoped_lock{mutex_};
  return fees_.pending_balance(principal);
}

uint64_t anchor_engine::total_anchors() const {
  auto lock = std::scoped_lock{mutex_};
  return total_anchors_;
}

amount_t anchor_engine::total_fees_collected() const {
  auto lock = std::scoped_lock{mutex_};
  return total_fees_collected_;
}

amount_t anchor_engine::base_fee() const {
  auto lock = std::scoped_lock{mutex_};
  return base_fee_;
}

bool anchor_engine::paused() const {
  auto lock = std::scoped_lock{mutex_};
  return paused_;
}

treasuries_t anchor_engine::treasuries() const {
  auto lock = std::scoped_lock{mutex_};
  return {fees_.foundation_treasury(), fees_.implementer_treasury()};
}

bool anchor_engine::has_role(const role_id_t role,
                             const principal_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return roles_.has_role(role, account);
}

amount_t anchor_engine::held_balance() const {
  auto lock = std::scoped_lock{mutex_};
  return fees_.held_balance();
}

amount_t anchor_engine::total_deposited() const {
  auto lock = std::scoped_lock{mutex_};
  return fees_.total_deposited();
}

amount_t anchor_engine::total_withdrawn() const {
  auto lock = std::scoped_lock{mutex_};
  return fees_.total_withdrawn();
}

const signing_domain_t& anchor_engine::domain() const {
  return authorizer_.domain();
}

block_context anchor_engine::current_block() const {
  auto lock = std::scoped_lock{mutex_};
  return block_;
}

canon::storage::committed_state anchor_engine::last_committed() const {
  auto lock = std::scoped_lock{mutex_};
  return last_committed_;
}

std::vector<event_record_t> anchor_engine::events() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = committed_events_;
  const auto& pending = events_.pending();
  out.insert(std::end(out), std::begin(pending), std::end(pending));
  return out;
}

replay_result_t anchor_engine::replay_events() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = replay_result_t{};
  result.state_root = last_committed_.state_root;

  auto registry = canon::ledger::hash_registry::entries_t{};
  auto nonces = canon::ledger::nonce_authority::entries_t{};
  auto anchors = uint64_t{};
  auto fees = amount_t{};
  auto withdrawn = amount_t{};
  auto expected_sequence = uint64_t{1};

  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorEventPrefix))) {
    auto record =
        encoding::try_decode_event_record(bytes_view_t{value.data(), value.size()});
    if (!record) {
      result.mismatches.push_back(
          fmt::format("undecodable event row {}", to_hex(key)));
      continue;
    }
    if (record->sequence != expected_sequence) {
      result.mismatches.push_back(fmt::format("event sequence gap at {}",
                                              record->sequence));
    }
    expected_sequence = record->sequence + 1;
    ++result.event_count;
    result.last_height = std::max(result.last_height, record->height);

    if (auto fee = anchor_fee(record->event); fee.has_value()) {
      ++anchors;
      fees += *fee;
      for (const auto& digest : recorded_digests(record->event)) {
        registry.insert_or_assign(digest, record->height);
      }
    }
    if (const auto* anchored = std::get_if<anchored_event_t>(&record->event);
        anchored != nullptr && anchored->executor.has_value()) {
      ++nonces[anchored->principal];
    }
    if (const auto* withdrawal =
            std::get_if<withdrawal_event_t>(&record->event);
        withdrawal != nullptr) {
      withdrawn += withdrawal->amount;
    }
  }

  auto persisted_registry = canon::ledger::hash_registry::entries_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorRegistryPrefix))) {
    auto digest = try_parse_hash_key(kAnchorRegistryPrefix, key);
    if (!digest) {
      canon::common::critical("corrupt anchor registry key");
    }
    persisted_registry.emplace(*digest, decode_u64(value, "registry"));
  }
  auto persisted_nonces = canon::ledger::nonce_authority::entries_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorNoncePrefix))) {
    auto principal = try_parse_hash_key(kAnchorNoncePrefix, key);
    if (!principal) {
      canon::common::critical("corrupt anchor nonce key");
    }
    persisted_nonces.emplace(*principal, decode_u64(value, "nonce"));
  }
  auto meta = meta_row{};
  if (auto raw = storage_.get(make_bytes(kAnchorMetaKey)); raw.has_value()) {
    meta = decode_meta(bytes_view_t{raw->data(), raw->size()});
  }

  if (anchors != meta.total_anchors) {
    result.mismatches.push_back(fmt::format(
        "total anchors: log {} state {}", anchors, meta.total_anchors));
  }
  if (fees != meta.total_fees) {
    result.mismatches.push_back(
        fmt::format("total fees: log {} state {}", canon::schema::to_string(fees),
                    canon::schema::to_string(meta.total_fees)));
  }
  if (fees != meta.deposited) {
    result.mismatches.push_back(fmt::format(
        "total deposited: log {} state {}", canon::schema::to_string(fees),
        canon::schema::to_string(meta.deposited)));
  }
  if (withdrawn != meta.withdrawn) {
    result.mismatches.push_back(fmt::format(
        "total withdrawn: log {} state {}", canon::schema::to_string(withdrawn),
        canon::schema::to_string(meta.withdrawn)));
  }
  if (meta.held + meta.withdrawn != meta.deposited) {
    result.mismatches.push_back("held balance does not reconcile");
  }
  if (registry != persisted_registry) {
    result.mismatches.push_back(
        fmt::format("registry: log {} digests state {} digests",
                    registry.size(), persisted_registry.size()));
  }
  if (nonces != persisted_nonces) {
    result.mismatches.push_back("signer nonces differ from the event log");
  }

  result.ok = result.mismatches.empty();
  if (result.ok) {
    spdlog::info("Replayed {} anchor events through height {}",
                 result.event_count, result.last_height);
  } else {
    for (const auto& mismatch : result.mismatches) {
      spdlog::error("Anchor replay mismatch: {}", mismatch);
    }
  }
  return result;
}

call_result<> anchor_engine::validate_anchor(
    const reentrancy_guard::scope& entry,
    const std::vector<digest_t>& digests,
    const uint8_t assurance_level,
    const amount_t& payment) const {
  if (auto allowed = admit_call(entry); !allowed.ok()) {
    return allowed;
  }
  if (paused_) {
    return make_failure(error_code::enforced_pause, kAnchorCodespace,
                        "registry is paused");
  }
  if (assurance_level > kMaxAssuranceLevel) {
    return make_failure(error_code::invalid_assurance_level, kAnchorCodespace,
                        fmt::format("assurance level {} exceeds {}",
                                    assurance_level, kMaxAssuranceLevel));
  }
  if (!digests_distinct(digests)) {
    return make_failure(error_code::indistinct_digests, kAnchorCodespace,
                        "anchored digest fields must be distinct");
  }
  if (payment < base_fee_) {
    return make_failure(error_code::insufficient_fee, kAnchorCodespace,
                        fmt::format("payment {} below base fee {}",
                                    canon::schema::to_string(payment),
                                    canon::schema::to_string(base_fee_)));
  }
  return make_success();
}

void anchor_engine::settle_anchor(const std::vector<digest_t>& digests,
                                  const amount_t& payment) {
  for (const auto& digest : digests) {
    registry_.record(digest, block_.height);
  }
  fees_.deposit(payment);
  ++total_anchors_;
  total_fees_collected_ += payment;
}

call_result<> anchor_engine::reject_if_reentrant(
    const reentrancy_guard::scope& entry) const {
  if (!entry.acquired()) {
    spdlog::warn("Rejected reentrant call into the anchor engine");
    return make_failure(error_code::reentrant_call, kAnchorCodespace,
                        "call is already in progress");
  }
  return make_success();
}

call_result<> anchor_engine::admit_call(
    const reentrancy_guard::scope& entry) const {
  if (auto allowed = reject_if_reentrant(entry); !allowed.ok()) {
    return allowed;
  }
  if (block_.height <= last_committed_.height) {
    return make_failure(error_code::invalid_block, kAnchorCodespace,
                        "no open block");
  }
  return make_success();
}

call_result<> anchor_engine::record_role_change(
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
    spdlog::info("Role {} {} {} by {}", canon::schema::to_string(role),
                 granted ? "granted to" : "revoked from", to_hex(account),
                 to_hex(sender));
  }
  return make_success();
}

std::vector<canon::storage::key_value_entry_t> anchor_engine::export_state()
    const {
  auto encoder = encoder_t{};
  auto rows = std::vector<canon::storage::key_value_entry_t>{};

  for (const auto& [digest, height] : registry_.entries()) {
    rows.emplace_back(make_hash_key(kAnchorRegistryPrefix, digest),
                      encoder.encode(height));
  }
  for (const auto& [principal, nonce] : nonces_.entries()) {
    rows.emplace_back(make_hash_key(kAnchorNoncePrefix, principal),
                      encoder.encode(nonce));
  }
  for (const auto& [principal, balance] : fees_.balances()) {
    rows.emplace_back(make_hash_key(kAnchorBalancePrefix, principal),
                      encoder.encode(to_amount_bytes(balance)));
  }
  for (const auto& [role, account] : roles_.members()) {
    rows.emplace_back(make_role_key(kAnchorRolePrefix, role, account),
                      encoder.encode(true));
  }
  rows.emplace_back(
      make_bytes(kAnchorMetaKey),
      encoder.encode(meta_tuple_t{
          paused_, to_amount_bytes(base_fee_), fees_.foundation_treasury(),
          fees_.implementer_treasury(), total_anchors_,
          to_amount_bytes(total_fees_collected_),
          to_amount_bytes(fees_.held_balance()),
          to_amount_bytes(fees_.total_deposited()),
          to_amount_bytes(fees_.total_withdrawn()), events_.next_sequence()}));
  return rows;
}

void anchor_engine::load_persisted_state(const anchor_engine_options& options) {
  auto committed =
      storage_.load_committed_state(make_bytes(kAnchorCheckpointKey));
  if (!committed.has_value()) {
    auto relayer = roles_.grant_role(options.admin, role_id_t::relayer,
                                     options.admin);
    if (!relayer.ok()) {
      canon::common::critical("failed to seat the registry admin as relayer");
    }
    spdlog::info("Initialized anchor registry with admin {} base fee {}",
                 to_hex(options.admin),
                 canon::schema::to_string(options.base_fee));
    return;
  }

  last_committed_ = *committed;
  block_.height = committed->height;

  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorRegistryPrefix))) {
    auto digest = try_parse_hash_key(kAnchorRegistryPrefix, key);
    if (!digest) {
      canon::common::critical("corrupt anchor registry key");
    }
    registry_.record(*digest, decode_u64(value, "registry"));
  }
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorNoncePrefix))) {
    auto principal = try_parse_hash_key(kAnchorNoncePrefix, key);
    if (!principal) {
      canon::common::critical("corrupt anchor nonce key");
    }
    nonces_.restore(*principal, decode_u64(value, "nonce"));
  }
  auto balances = canon::ledger::fee_ledger::balances_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorBalancePrefix))) {
    auto principal = try_parse_hash_key(kAnchorBalancePrefix, key);
    auto balance = encoder_t{}.try_decode<amount_bytes_t>(
        bytes_view_t{value.data(), value.size()});
    if (!principal || !balance) {
      canon::common::critical("corrupt anchor balance row");
    }
    balances.emplace(*principal, from_amount_bytes(*balance));
  }
  auto members = canon::ledger::access_control::membership_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorRolePrefix))) {
    auto member = try_parse_role_key(kAnchorRolePrefix, key);
    if (!member) {
      canon::common::critical("corrupt anchor role key");
    }
    members.insert(*member);
  }
  roles_.restore(std::move(members));

  auto raw_meta = storage_.get(make_bytes(kAnchorMetaKey));
  if (!raw_meta.has_value()) {
    canon::common::critical("anchor meta row missing from committed state");
  }
  auto meta = decode_meta(bytes_view_t{raw_meta->data(), raw_meta->size()});
  paused_ = meta.paused;
  base_fee_ = meta.base_fee;
  total_anchors_ = meta.total_anchors;
  total_fees_collected_ = meta.total_fees;
  fees_.set_treasuries(meta.foundation, meta.implementer);
  fees_.restore(meta.held, meta.deposited, meta.withdrawn, std::move(balances));
  events_.restore_sequence(meta.next_sequence);

  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(kAnchorEventPrefix))) {
    auto record = encoding::try_decode_event_record(
        bytes_view_t{value.data(), value.size()});
    if (!record) {
      canon::common::critical("corrupt anchor event row");
    }
    committed_events_.push_back(std::move(*record));
  }

  spdlog::info("Loaded anchor registry at height {} ({} anchors, {} events)",
               last_committed_.height, total_anchors_,
               committed_events_.size());
}

}  // namespace canon::execution
