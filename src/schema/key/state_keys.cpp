#include <canon/schema/key/state_keys.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstring>

namespace canon::schema::key {

const std::string_view kAnchorStatePrefix{"SYS|STATE|ANCHOR|"};
const std::string_view kAnchorRegistryPrefix{"SYS|STATE|ANCHOR|REGISTRY|"};
const std::string_view kAnchorNoncePrefix{"SYS|STATE|ANCHOR|NONCE|"};
const std::string_view kAnchorBalancePrefix{"SYS|STATE|ANCHOR|BALANCE|"};
const std::string_view kAnchorRolePrefix{"SYS|STATE|ANCHOR|ROLE|"};
const std::string_view kAnchorMetaKey{"SYS|STATE|ANCHOR|META"};
const std::string_view kAnchorEventPrefix{"SYS|EVENT|ANCHOR|"};
const std::string_view kAnchorCheckpointKey{"SYS|COMMITTED|ANCHOR"};

const std::string_view kReceiptStatePrefix{"SYS|STATE|RECEIPT|"};
const std::string_view kReceiptTokenPrefix{"SYS|STATE|RECEIPT|TOKEN|"};
const std::string_view kReceiptRolePrefix{"SYS|STATE|RECEIPT|ROLE|"};
const std::string_view kReceiptMetaKey{"SYS|STATE|RECEIPT|META"};
const std::string_view kReceiptEventPrefix{"SYS|EVENT|RECEIPT|"};
const std::string_view kReceiptCheckpointKey{"SYS|COMMITTED|RECEIPT"};

namespace {

bool has_prefix(std::string_view prefix,
                const canon::schema::bytes_view_t& key) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                    [](const char lhs, const uint8_t rhs) {
                      return static_cast<uint8_t>(lhs) == rhs;
                    });
}

}  // namespace

canon::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const canon::schema::bytes_view_t& id) {
  auto key = canon::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

canon::schema::bytes_t make_hash_key(std::string_view prefix,
                                     const canon::schema::hash32_t& id) {
  return make_prefixed_key(prefix,
                           canon::schema::bytes_view_t{id.data(), id.size()});
}

canon::schema::bytes_t make_role_key(
    std::string_view prefix,
    const canon::schema::role_id_t role,
    const canon::schema::principal_t& account) {
  auto key = canon::schema::make_bytes(prefix);
  key.push_back(static_cast<uint8_t>(role));
  key.insert(std::end(key), std::begin(account), std::end(account));
  return key;
}

canon::schema::bytes_t make_sequence_key(std::string_view prefix,
                                         const uint64_t sequence) {
  auto big_endian = boost::endian::native_to_big(sequence);
  auto raw = std::array<uint8_t, sizeof(uint64_t)>{};
  std::memcpy(raw.data(), &big_endian, raw.size());
  return make_prefixed_key(prefix,
                           canon::schema::bytes_view_t{raw.data(), raw.size()});
}

std::optional<canon::schema::hash32_t> try_parse_hash_key(
    std::string_view prefix,
    const canon::schema::bytes_view_t& key) {
  auto out = canon::schema::hash32_t{};
  if (!has_prefix(prefix, key) || key.size() != prefix.size() + out.size()) {
    return std::nullopt;
  }
  std::copy_n(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
              out.size(), std::begin(out));
  return out;
}

std::optional<uint64_t> try_parse_sequence_key(
    std::string_view prefix,
    const canon::schema::bytes_view_t& key) {
  if (!has_prefix(prefix, key) ||
      key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto big_endian = uint64_t{};
  std::memcpy(&big_endian, key.data() + prefix.size(), sizeof(uint64_t));
  return boost::endian::big_to_native(big_endian);
}

std::optional<std::pair<canon::schema::role_id_t, canon::schema::principal_t>>
try_parse_role_key(std::string_view prefix,
                   const canon::schema::bytes_view_t& key) {
  auto account = canon::schema::principal_t{};
  if (!has_prefix(prefix, key) ||
      key.size() != prefix.size() + 1 + account.size()) {
    return std::nullopt;
  }
  auto role = key[prefix.size()];
  if (role > static_cast<uint8_t>(canon::schema::role_id_t::minter)) {
    return std::nullopt;
  }
  std::copy_n(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size() + 1),
              account.size(), std::begin(account));
  return std::pair{static_cast<canon::schema::role_id_t>(role), account};
}

}  // namespace canon::schema::key
