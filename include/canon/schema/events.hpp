#pragma once

#include <canon/schema/primitives.hpp>
#include <canon/schema/role_id.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Schema type: events.
// Append-only audit trail. Every successful state-changing call emits exactly
// one event; the event log, not the point-lookup state, is the canonical
// record of what happened.
namespace canon::schema {

struct anchored_event_t final {
  digest_t warrant_digest{};
  digest_t attestation_digest{};
  principal_t principal{};
  digest_t subject_tag{};
  digest_t controller_did_hash{};
  uint8_t assurance_level{};
  timestamp_milliseconds_t timestamp{};
  amount_t fee{};
  // Set on the meta-transaction path only.
  std::optional<principal_t> executor;
};

struct warrant_anchored_event_t final {
  digest_t warrant_hash{};
  digest_t subject_handle_hash{};
  digest_t enterprise_hash{};
  std::string enterprise_id;
  std::string warrant_id;
  principal_t submitter{};
  timestamp_milliseconds_t timestamp{};
  amount_t fee{};
};

struct attestation_anchored_event_t final {
  digest_t attestation_hash{};
  digest_t warrant_hash{};
  digest_t enterprise_hash{};
  std::string enterprise_id;
  std::string attestation_id;
  principal_t submitter{};
  timestamp_milliseconds_t timestamp{};
  amount_t fee{};
};

struct receipt_anchored_event_t final {
  digest_t receipt_hash{};
  digest_t warrant_hash{};
  digest_t attestation_hash{};
  principal_t subject_wallet{};
  principal_t submitter{};
  timestamp_milliseconds_t timestamp{};
  amount_t fee{};
};

struct withdrawal_event_t final {
  principal_t principal{};
  amount_t amount{};
  timestamp_milliseconds_t timestamp{};
  bool emergency{};
};

struct pause_changed_event_t final {
  principal_t account{};
  bool paused{};
};

struct role_changed_event_t final {
  role_id_t role{};
  principal_t account{};
  principal_t sender{};
  bool granted{};
};

struct base_fee_changed_event_t final {
  amount_t fee{};
  principal_t sender{};
};

struct treasuries_changed_event_t final {
  principal_t foundation{};
  principal_t implementer{};
  principal_t sender{};
};

struct receipt_minted_event_t final {
  token_id_t token_id{};
  digest_t content_hash{};
  principal_t to{};
  principal_t minter{};
  timestamp_milliseconds_t timestamp{};
};

struct receipt_burned_event_t final {
  token_id_t token_id{};
  digest_t content_hash{};
  principal_t owner{};
  principal_t burner{};
  timestamp_milliseconds_t timestamp{};
};

struct minting_toggled_event_t final {
  bool enabled{};
  principal_t sender{};
};

using event_t = std::variant<anchored_event_t,
                             warrant_anchored_event_t,
                             attestation_anchored_event_t,
                             receipt_anchored_event_t,
                             withdrawal_event_t,
                             pause_changed_event_t,
                             role_changed_event_t,
                             base_fee_changed_event_t,
                             treasuries_changed_event_t,
                             receipt_minted_event_t,
                             receipt_burned_event_t,
                             minting_toggled_event_t>;

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  uint64_t height{};
  event_t event{};
};

using event_record_t = event_record<1>;

}  // namespace canon::schema
