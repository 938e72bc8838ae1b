#pragma once
#include <canon/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace canon::storage {

using key_value_entry_t =
    std::pair<canon::schema::bytes_t, canon::schema::bytes_t>;

/// Last committed checkpoint of one ledger component.
struct committed_state final {
  uint64_t height{};
  canon::schema::hash32_t state_root{};
};

/// Everything one component commits for a block, written atomically:
/// the component's state keyspace is replaced wholesale and the block's
/// event rows are appended.
struct commit_batch final {
  canon::schema::bytes_t checkpoint_key;
  committed_state checkpoint;
  canon::schema::bytes_t state_prefix;
  std::vector<key_value_entry_t> state_rows;
  std::vector<key_value_entry_t> appended_rows;
};

template <typename Library>
struct storage {
  /// Raw value at key, or std::nullopt when missing.
  std::optional<canon::schema::bytes_t> get(
      const canon::schema::bytes_view_t& key) const;

  void put(const canon::schema::bytes_view_t& key,
           const canon::schema::bytes_view_t& value) const;

  std::optional<committed_state> load_committed_state(
      const canon::schema::bytes_view_t& checkpoint_key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const canon::schema::bytes_view_t& prefix) const;

  void commit(const commit_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace canon::storage
