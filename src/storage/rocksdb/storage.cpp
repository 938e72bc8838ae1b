#include <canon/common/critical.hpp>
#include <canon/schema/encoding/scale/encoder.hpp>
#include <canon/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <tuple>

namespace canon::storage {

namespace {

using encoder_t = canon::schema::encoding::scale_encoder_t;

ROCKSDB_NAMESPACE::Slice make_slice(const canon::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

ROCKSDB_NAMESPACE::Slice make_slice(const canon::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

canon::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

void require_open(const storage<rocksdb_storage_tag>& store) {
  if (!store.database) {
    canon::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

std::optional<canon::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const canon::schema::bytes_view_t& key) const {
  require_open(*this);
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, make_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    canon::common::critical("Failed to get value from RocksDB");
  }
  return canon::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::put(
    const canon::schema::bytes_view_t& key,
    const canon::schema::bytes_view_t& value) const {
  require_open(*this);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              make_slice(key), make_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    canon::common::critical("Failed to put value into RocksDB");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state(
    const canon::schema::bytes_view_t& checkpoint_key) const {
  auto raw = get(checkpoint_key);
  if (!raw.has_value()) {
    return std::nullopt;
  }

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, canon::schema::hash32_t>>(
          canon::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    canon::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const canon::schema::bytes_view_t& prefix) const {
  require_open(*this);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = make_slice(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    canon::common::critical("failed to scan RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const commit_batch& batch) const {
  require_open(*this);

  auto write_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto prefix_slice = make_slice(batch.state_prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    if (!write_batch.Delete(iterator->key()).ok()) {
      canon::common::critical("failed deleting key during state replacement");
    }
  }
  if (!iterator->status().ok()) {
    canon::common::critical("failed to scan state keyspace during commit");
  }

  for (const auto& [key, value] : batch.state_rows) {
    if (!write_batch.Put(make_slice(key), make_slice(value)).ok()) {
      canon::common::critical("failed writing state row during commit");
    }
  }
  for (const auto& [key, value] : batch.appended_rows) {
    if (!write_batch.Put(make_slice(key), make_slice(value)).ok()) {
      canon::common::critical("failed writing appended row during commit");
    }
  }

  auto encoder = encoder_t{};
  auto checkpoint = encoder.encode(
      std::tuple{batch.checkpoint.height, batch.checkpoint.state_root});
  if (!write_batch.Put(make_slice(batch.checkpoint_key), make_slice(checkpoint))
           .ok()) {
    canon::common::critical("failed writing checkpoint during commit");
  }

  auto status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &write_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit batch to RocksDB: {}", status.ToString());
    canon::common::critical("failed to commit state batch");
  }
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    canon::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace canon::storage
