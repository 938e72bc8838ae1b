#pragma once

#include <canon/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Stable rejection identifiers surfaced verbatim to relayers so they can
// branch on duplicate vs. disabled vs. underpaid without parsing logs.
namespace canon::schema {

enum class error_code : uint32_t {
  ok = 0,
  // authorization
  unauthorized = 1,
  nonce_mismatch = 2,
  expired_request = 3,
  invalid_signature = 4,
  // validation
  invalid_assurance_level = 10,
  insufficient_fee = 11,
  invalid_content_hash = 12,
  zero_recipient = 13,
  invalid_treasury = 14,
  indistinct_digests = 15,
  invalid_block = 16,
  // state conflict
  duplicate_content_hash = 20,
  unknown_token = 21,
  no_balance = 22,
  // value movement
  transfer_failed = 30,
  // lifecycle
  enforced_pause = 40,
  expected_pause = 41,
  reentrant_call = 42,
  minting_disabled = 43,
  transfers_disabled = 44,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"unauthorized",
                                            error_code::unauthorized},
    std::pair<std::string_view, error_code>{"nonce_mismatch",
                                            error_code::nonce_mismatch},
    std::pair<std::string_view, error_code>{"expired_request",
                                            error_code::expired_request},
    std::pair<std::string_view, error_code>{"invalid_signature",
                                            error_code::invalid_signature},
    std::pair<std::string_view, error_code>{
        "invalid_assurance_level", error_code::invalid_assurance_level},
    std::pair<std::string_view, error_code>{"insufficient_fee",
                                            error_code::insufficient_fee},
    std::pair<std::string_view, error_code>{"invalid_content_hash",
                                            error_code::invalid_content_hash},
    std::pair<std::string_view, error_code>{"zero_recipient",
                                            error_code::zero_recipient},
    std::pair<std::string_view, error_code>{"invalid_treasury",
                                            error_code::invalid_treasury},
    std::pair<std::string_view, error_code>{"indistinct_digests",
                                            error_code::indistinct_digests},
    std::pair<std::string_view, error_code>{"invalid_block",
                                            error_code::invalid_block},
    std::pair<std::string_view, error_code>{
        "duplicate_content_hash", error_code::duplicate_content_hash},
    std::pair<std::string_view, error_code>{"unknown_token",
                                            error_code::unknown_token},
    std::pair<std::string_view, error_code>{"no_balance",
                                            error_code::no_balance},
    std::pair<std::string_view, error_code>{"transfer_failed",
                                            error_code::transfer_failed},
    std::pair<std::string_view, error_code>{"enforced_pause",
                                            error_code::enforced_pause},
    std::pair<std::string_view, error_code>{"expected_pause",
                                            error_code::expected_pause},
    std::pair<std::string_view, error_code>{"reentrant_call",
                                            error_code::reentrant_call},
    std::pair<std::string_view, error_code>{"minting_disabled",
                                            error_code::minting_disabled},
    std::pair<std::string_view, error_code>{"transfers_disabled",
                                            error_code::transfers_disabled},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return name_of(value, kErrorCodeMappings);
}

}  // namespace canon::schema
