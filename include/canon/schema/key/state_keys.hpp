#pragma once
#include <canon/schema/primitives.hpp>
#include <canon/schema/role_id.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: state keys.
// Keyspaces for the committed state of the anchor registry and the receipt
// token. Each component owns one state prefix, replaced wholesale on commit,
// and one event prefix, appended to on commit.
namespace canon::schema::key {

extern const std::string_view kAnchorStatePrefix;
extern const std::string_view kAnchorRegistryPrefix;
extern const std::string_view kAnchorNoncePrefix;
extern const std::string_view kAnchorBalancePrefix;
extern const std::string_view kAnchorRolePrefix;
extern const std::string_view kAnchorMetaKey;
extern const std::string_view kAnchorEventPrefix;
extern const std::string_view kAnchorCheckpointKey;

extern const std::string_view kReceiptStatePrefix;
extern const std::string_view kReceiptTokenPrefix;
extern const std::string_view kReceiptRolePrefix;
extern const std::string_view kReceiptMetaKey;
extern const std::string_view kReceiptEventPrefix;
extern const std::string_view kReceiptCheckpointKey;

canon::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const canon::schema::bytes_view_t& id);
canon::schema::bytes_t make_hash_key(std::string_view prefix,
                                     const canon::schema::hash32_t& id);
canon::schema::bytes_t make_role_key(std::string_view prefix,
                                     canon::schema::role_id_t role,
                                     const canon::schema::principal_t& account);

/// Sequence numbers are stored big-endian so key order is numeric order.
canon::schema::bytes_t make_sequence_key(std::string_view prefix,
                                         uint64_t sequence);

/// Inverse of make_hash_key; std::nullopt when key is not prefix + 32 bytes.
std::optional<canon::schema::hash32_t> try_parse_hash_key(
    std::string_view prefix,
    const canon::schema::bytes_view_t& key);
std::optional<uint64_t> try_parse_sequence_key(
    std::string_view prefix,
    const canon::schema::bytes_view_t& key);
std::optional<std::pair<canon::schema::role_id_t, canon::schema::principal_t>>
try_parse_role_key(std::string_view prefix,
                   const canon::schema::bytes_view_t& key);

}  // namespace canon::schema::key
