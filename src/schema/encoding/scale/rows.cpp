#include <canon/schema/encoding/scale/encoder.hpp>
#include <canon/schema/encoding/scale/rows.hpp>

#include <string>
#include <tuple>

using namespace canon::schema;

namespace canon::schema::encoding {

namespace {

using anchored_row_t = std::tuple<hash32_t,
                                  hash32_t,
                                  hash32_t,
                                  hash32_t,
                                  hash32_t,
                                  uint8_t,
                                  uint64_t,
                                  amount_bytes_t,
                                  std::optional<hash32_t>>;
using warrant_row_t = std::tuple<hash32_t,
                                 hash32_t,
                                 hash32_t,
                                 std::string,
                                 std::string,
                                 hash32_t,
                                 uint64_t,
                                 amount_bytes_t>;
using attestation_row_t = warrant_row_t;
using receipt_anchored_row_t = std::
    tuple<hash32_t, hash32_t, hash32_t, hash32_t, hash32_t, uint64_t, amount_bytes_t>;
using withdrawal_row_t = std::tuple<hash32_t, amount_bytes_t, uint64_t, bool>;
using pause_row_t = std::tuple<hash32_t, bool>;
using role_row_t = std::tuple<uint8_t, hash32_t, hash32_t, bool>;
using base_fee_row_t = std::tuple<amount_bytes_t, hash32_t>;
using treasuries_row_t = std::tuple<hash32_t, hash32_t, hash32_t>;
using receipt_token_row_t =
    std::tuple<uint64_t, hash32_t, hash32_t, hash32_t, uint64_t>;
using minting_row_t = std::tuple<bool, hash32_t>;

using record_row_t =
    std::tuple<uint16_t, uint64_t, uint64_t, uint8_t, bytes_t>;
using receipt_row_t =
    std::tuple<uint16_t, uint64_t, hash32_t, hash32_t, uint64_t, hash32_t>;

bytes_t encode_body(const event_t& event) {
  auto encoder = scale_encoder_t{};
  return std::visit(
      overloaded{
          [&](const anchored_event_t& value) {
            return encoder.encode(anchored_row_t{
                value.warrant_digest, value.attestation_digest,
                value.principal, value.subject_tag, value.controller_did_hash,
                value.assurance_level, value.timestamp,
                to_amount_bytes(value.fee), value.executor});
          },
          [&](const warrant_anchored_event_t& value) {
            return encoder.encode(warrant_row_t{
                value.warrant_hash, value.subject_handle_hash,
                value.enterprise_hash, value.enterprise_id, value.warrant_id,
                value.submitter, value.timestamp,
                to_amount_bytes(value.fee)});
          },
          [&](const attestation_anchored_event_t& value) {
            return encoder.encode(attestation_row_t{
                value.attestation_hash, value.warrant_hash,
                value.enterprise_hash, value.enterprise_id,
                value.attestation_id, value.submitter, value.timestamp,
                to_amount_bytes(value.fee)});
          },
          [&](const receipt_anchored_event_t& value) {
            return encoder.encode(receipt_anchored_row_t{
                value.receipt_hash, value.warrant_hash,
                value.attestation_hash, value.subject_wallet, value.submitter,
                value.timestamp, to_amount_bytes(value.fee)});
          },
          [&](const withdrawal_event_t& value) {
            return encoder.encode(
                withdrawal_row_t{value.principal, to_amount_bytes(value.amount),
                                 value.timestamp, value.emergency});
          },
          [&](const pause_changed_event_t& value) {
            return encoder.encode(pause_row_t{value.account, value.paused});
          },
          [&](const role_changed_event_t& value) {
            return encoder.encode(
                role_row_t{static_cast<uint8_t>(value.role), value.account,
                           value.sender, value.granted});
          },
          [&](const base_fee_changed_event_t& value) {
            return encoder.encode(
                base_fee_row_t{to_amount_bytes(value.fee), value.sender});
          },
          [&](const treasuries_changed_event_t& value) {
            return encoder.encode(treasuries_row_t{
                value.foundation, value.implementer, value.sender});
          },
          [&](const receipt_minted_event_t& value) {
            return encoder.encode(
                receipt_token_row_t{value.token_id, value.content_hash,
                                    value.to, value.minter, value.timestamp});
          },
          [&](const receipt_burned_event_t& value) {
            return encoder.encode(receipt_token_row_t{
                value.token_id, value.content_hash, value.owner, value.burner,
                value.timestamp});
          },
          [&](const minting_toggled_event_t& value) {
            return encoder.encode(minting_row_t{value.enabled, value.sender});
          }},
      event);
}

std::optional<event_t> decode_body(const uint8_t index,
                                   const bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  switch (index) {
    case 0: {
      auto row = encoder.try_decode<anchored_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [warrant, attestation, principal, subject, controller, assurance,
             timestamp, fee, executor] = *row;
      return anchored_event_t{.warrant_digest = warrant,
                              .attestation_digest = attestation,
                              .principal = principal,
                              .subject_tag = subject,
                              .controller_did_hash = controller,
                              .assurance_level = assurance,
                              .timestamp = timestamp,
                              .fee = from_amount_bytes(fee),
                              .executor = executor};
    }
    case 1: {
      auto row = encoder.try_decode<warrant_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [warrant, subject, enterprise, enterprise_id, warrant_id,
             submitter, timestamp, fee] = *row;
      return warrant_anchored_event_t{.warrant_hash = warrant,
                                      .subject_handle_hash = subject,
                                      .enterprise_hash = enterprise,
                                      .enterprise_id = enterprise_id,
                                      .warrant_id = warrant_id,
                                      .submitter = submitter,
                                      .timestamp = timestamp,
                                      .fee = from_amount_bytes(fee)};
    }
    case 2: {
      auto row = encoder.try_decode<attestation_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [attestation, warrant, enterprise, enterprise_id, attestation_id,
             submitter, timestamp, fee] = *row;
      return attestation_anchored_event_t{.attestation_hash = attestation,
                                          .warrant_hash = warrant,
                                          .enterprise_hash = enterprise,
                                          .enterprise_id = enterprise_id,
                                          .attestation_id = attestation_id,
                                          .submitter = submitter,
                                          .timestamp = timestamp,
                                          .fee = from_amount_bytes(fee)};
    }
    case 3: {
      auto row = encoder.try_decode<receipt_anchored_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [receipt, warrant, attestation, wallet, submitter, timestamp,
             fee] = *row;
      return receipt_anchored_event_t{.receipt_hash = receipt,
                                      .warrant_hash = warrant,
                                      .attestation_hash = attestation,
                                      .subject_wallet = wallet,
                                      .submitter = submitter,
                                      .timestamp = timestamp,
                                      .fee = from_amount_bytes(fee)};
    }
    case 4: {
      auto row = encoder.try_decode<withdrawal_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [principal, amount, timestamp, emergency] = *row;
      return withdrawal_event_t{.principal = principal,
                                .amount = from_amount_bytes(amount),
                                .timestamp = timestamp,
                                .emergency = emergency};
    }
    case 5: {
      auto row = encoder.try_decode<pause_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      return pause_changed_event_t{.account = std::get<0>(*row),
                                   .paused = std::get<1>(*row)};
    }
    case 6: {
      auto row = encoder.try_decode<role_row_t>(bytes);
      if (!row ||
          std::get<0>(*row) > static_cast<uint8_t>(role_id_t::minter)) {
        return std::nullopt;
      }
      return role_changed_event_t{
          .role = static_cast<role_id_t>(std::get<0>(*row)),
          .account = std::get<1>(*row),
          .sender = std::get<2>(*row),
          .granted = std::get<3>(*row)};
    }
    case 7: {
      auto row = encoder.try_decode<base_fee_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      return base_fee_changed_event_t{
          .fee = from_amount_bytes(std::get<0>(*row)),
          .sender = std::get<1>(*row)};
    }
    case 8: {
      auto row = encoder.try_decode<treasuries_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      return treasuries_changed_event_t{.foundation = std::get<0>(*row),
                                        .implementer = std::get<1>(*row),
                                        .sender = std::get<2>(*row)};
    }
    case 9: {
      auto row = encoder.try_decode<receipt_token_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [token_id, content_hash, to, minter, timestamp] = *row;
      return receipt_minted_event_t{.token_id = token_id,
                                    .content_hash = content_hash,
                                    .to = to,
                                    .minter = minter,
                                    .timestamp = timestamp};
    }
    case 10: {
      auto row = encoder.try_decode<receipt_token_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      auto& [token_id, content_hash, owner, burner, timestamp] = *row;
      return receipt_burned_event_t{.token_id = token_id,
                                    .content_hash = content_hash,
                                    .owner = owner,
                                    .burner = burner,
                                    .timestamp = timestamp};
    }
    case 11: {
      auto row = encoder.try_decode<minting_row_t>(bytes);
      if (!row) {
        return std::nullopt;
      }
      return minting_toggled_event_t{.enabled = std::get<0>(*row),
                                     .sender = std::get<1>(*row)};
    }
    default:
      return std::nullopt;
  }
}

}  // namespace

amount_bytes_t to_amount_bytes(const amount_t& value) {
  auto out = amount_bytes_t{};
  for (auto i = std::size_t{0}; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xff);
  }
  return out;
}

amount_t from_amount_bytes(const amount_bytes_t& bytes) {
  auto value = amount_t{0};
  for (auto i = bytes.size(); i > 0; --i) {
    value <<= 8;
    value |= bytes[i - 1];
  }
  return value;
}

bytes_t encode_event_record(const event_record_t& record) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(
      record_row_t{record.version, record.sequence, record.height,
                   static_cast<uint8_t>(record.event.index()),
                   encode_body(record.event)});
}

std::optional<event_record_t> try_decode_event_record(
    const bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  auto row = encoder.try_decode<record_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, sequence, height, index, body] = *row;
  if (version != 1) {
    return std::nullopt;
  }
  auto event = decode_body(index, bytes_view_t{body.data(), body.size()});
  if (!event) {
    return std::nullopt;
  }
  auto record = event_record_t{};
  record.sequence = sequence;
  record.height = height;
  record.event = std::move(*event);
  return record;
}

bytes_t encode_receipt(const receipt_t& value) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(receipt_row_t{value.version, value.token_id,
                                      value.content_hash, value.owner,
                                      value.minted_at, value.original_minter});
}

std::optional<receipt_t> try_decode_receipt(const bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  auto row = encoder.try_decode<receipt_row_t>(bytes);
  if (!row || std::get<0>(*row) != 1) {
    return std::nullopt;
  }
  auto out = receipt_t{};
  out.token_id = std::get<1>(*row);
  out.content_hash = std::get<2>(*row);
  out.owner = std::get<3>(*row);
  out.minted_at = std::get<4>(*row);
  out.original_minter = std::get<5>(*row);
  return out;
}

}  // namespace canon::schema::encoding
