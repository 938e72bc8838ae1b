#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <canon/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace canon::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<canon::schema::bytes_t> get(
      const canon::schema::bytes_view_t& key) const;
  void put(const canon::schema::bytes_view_t& key,
           const canon::schema::bytes_view_t& value) const;
  std::optional<committed_state> load_committed_state(
      const canon::schema::bytes_view_t& checkpoint_key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const canon::schema::bytes_view_t& prefix) const;
  void commit(const commit_batch& batch) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace canon::storage
