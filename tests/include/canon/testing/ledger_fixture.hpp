#pragma once

#include <canon/execution/anchor_engine.hpp>
#include <canon/schema/anchor_fields.hpp>
#include <canon/storage/rocksdb/storage.hpp>
#include <canon/testing/common.hpp>
#include <canon/token/receipt_token.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>

namespace canon::testing {

inline canon::schema::principal_t admin_principal() {
  return make_hash(0xA0);
}

inline canon::schema::principal_t foundation_principal() {
  return make_hash(0xB0);
}

inline canon::schema::principal_t implementer_principal() {
  return make_hash(0xC0);
}

inline canon::schema::signing_domain_t test_domain() {
  return canon::schema::signing_domain_t{.chain_id = make_hash(0x01),
                                         .registry_id = make_hash(0x02)};
}

/// Four distinct digests derived from seed.
inline canon::schema::anchor_fields_t make_fields(const uint8_t seed) {
  return canon::schema::anchor_fields_t{
      .warrant_digest = make_hash(seed),
      .attestation_digest = make_hash(static_cast<uint8_t>(seed + 64)),
      .subject_tag = make_hash(static_cast<uint8_t>(seed + 128)),
      .controller_did_hash = make_hash(static_cast<uint8_t>(seed + 192))};
}

/// Anchor engine and receipt token over one temporary RocksDB.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix,
                          const bool minting_enabled = true)
      : db_path_{make_db_path(db_prefix)}, minting_enabled_{minting_enabled} {
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    close();
    remove_path(db_path_);
  }

  canon::execution::anchor_engine& engine() { return *engine_; }
  canon::token::receipt_token& token() { return *token_; }
  canon::storage::rocksdb_storage_t& storage() { return *storage_; }

  static canon::execution::anchor_engine_options engine_options() {
    return canon::execution::anchor_engine_options{
        .domain = test_domain(),
        .admin = admin_principal(),
        .foundation_treasury = foundation_principal(),
        .implementer_treasury = implementer_principal(),
        .base_fee = canon::execution::kDefaultBaseFee};
  }

  canon::token::receipt_token_options token_options() const {
    auto options = canon::token::receipt_token_options{};
    options.admin = admin_principal();
    options.minting_enabled = minting_enabled_;
    return options;
  }

  /// Open a block on both components.
  void begin_block(const uint64_t height,
                   const canon::schema::timestamp_milliseconds_t timestamp) {
    ASSERT_TRUE(engine_->begin_block(height, timestamp).ok());
    ASSERT_TRUE(token_->begin_block(height, timestamp).ok());
  }

  /// Commit the engine first so receipts issued from its events land in the
  /// token's block.
  void commit() {
    ASSERT_TRUE(engine_->commit().ok());
    ASSERT_TRUE(token_->commit().ok());
  }

  /// Drop every component and reload from the same database.
  void reopen() {
    close();
    open();
  }

 private:
  void open() {
    storage_ = std::make_unique<canon::storage::rocksdb_storage_t>(
        canon::storage::make_storage<canon::storage::rocksdb_storage_tag>(
            db_path_));
    engine_ = std::make_unique<canon::execution::anchor_engine>(
        *storage_, engine_options());
    token_ = std::make_unique<canon::token::receipt_token>(*storage_,
                                                          token_options());
  }

  void close() {
    token_.reset();
    engine_.reset();
    storage_.reset();
  }

  std::string db_path_;
  bool minting_enabled_{true};
  std::unique_ptr<canon::storage::rocksdb_storage_t> storage_;
  std::unique_ptr<canon::execution::anchor_engine> engine_;
  std::unique_ptr<canon::token::receipt_token> token_;
};

}  // namespace canon::testing
