#include <canon/schema/key/state_keys.hpp>
#include <canon/storage/rocksdb/storage.hpp>
#include <canon/storage/state_root.hpp>
#include <canon/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using canon::schema::bytes_t;
using canon::schema::bytes_view_t;
using canon::schema::make_bytes;
using canon::testing::make_hash;

namespace {

using storage_t = canon::storage::rocksdb_storage_t;

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

canon::storage::key_value_entry_t make_row(const std::string_view key,
                                           const std::string_view value) {
  return {make_bytes(key), make_bytes(value)};
}

class storage_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = canon::testing::make_db_path("canon_storage");
  }

  void TearDown() override { canon::testing::remove_path(db_path_); }

  storage_t open() {
    return canon::storage::make_storage<canon::storage::rocksdb_storage_tag>(
        db_path_);
  }

  std::string db_path_;
};

}  // namespace

TEST_F(storage_test, get_returns_nullopt_for_missing_key) {
  auto storage = open();
  auto key = make_bytes(std::string_view{"missing"});
  EXPECT_FALSE(storage.get(view(key)).has_value());

  auto value = bytes_t{1, 2, 3};
  storage.put(view(key), view(value));
  EXPECT_EQ(storage.get(view(key)), value);
}

TEST_F(storage_test, list_by_prefix_returns_matching_rows_in_key_order) {
  auto storage = open();
  for (const auto& [key, value] :
       std::vector{make_row("A|2", "two"), make_row("A|1", "one"),
                   make_row("B|1", "other"), make_row("A|3", "three")}) {
    storage.put(view(key), view(value));
  }

  auto rows = storage.list_by_prefix(view(make_bytes(std::string_view{"A|"})));
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].first, make_bytes(std::string_view{"A|1"}));
  EXPECT_EQ(rows[2].second, make_bytes(std::string_view{"three"}));
}

TEST_F(storage_test, commit_replaces_state_prefix_and_appends_rows) {
  auto checkpoint_key = make_bytes(std::string_view{"CHECKPOINT"});
  {
    auto storage = open();
    EXPECT_FALSE(storage.load_committed_state(view(checkpoint_key)).has_value());

    auto first = canon::storage::commit_batch{};
    first.checkpoint_key = checkpoint_key;
    first.checkpoint = {.height = 1, .state_root = make_hash(1)};
    first.state_prefix = make_bytes(std::string_view{"S|"});
    first.state_rows = {make_row("S|a", "1"), make_row("S|b", "2")};
    first.appended_rows = {make_row("E|1", "x")};
    storage.commit(first);

    auto second = first;
    second.checkpoint = {.height = 2, .state_root = make_hash(2)};
    second.state_rows = {make_row("S|b", "3")};
    second.appended_rows = {make_row("E|2", "y")};
    storage.commit(second);
  }

  auto storage = open();
  auto committed = storage.load_committed_state(view(checkpoint_key));
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 2u);
  EXPECT_EQ(committed->state_root, make_hash(2));

  auto state = storage.list_by_prefix(view(make_bytes(std::string_view{"S|"})));
  ASSERT_EQ(state.size(), 1u);
  EXPECT_EQ(state[0].second, make_bytes(std::string_view{"3"}));
  EXPECT_EQ(
      storage.list_by_prefix(view(make_bytes(std::string_view{"E|"}))).size(),
      2u);
}

TEST(state_root, is_independent_of_row_order) {
  auto rows = std::vector{make_row("b", "2"), make_row("a", "1")};
  auto reversed = std::vector{make_row("a", "1"), make_row("b", "2")};
  auto root = canon::storage::seal_state_rows(rows);
  EXPECT_EQ(root, canon::storage::seal_state_rows(reversed));
  EXPECT_EQ(rows[0].first, make_bytes(std::string_view{"a"}));

  auto changed = std::vector{make_row("a", "1"), make_row("b", "3")};
  EXPECT_NE(root, canon::storage::seal_state_rows(changed));

  auto empty = std::vector<canon::storage::key_value_entry_t>{};
  EXPECT_TRUE(canon::schema::is_zero(canon::storage::seal_state_rows(empty)));
}

TEST(state_keys, sequence_keys_sort_numerically) {
  using namespace canon::schema::key;
  auto low = make_sequence_key(kAnchorEventPrefix, 255);
  auto high = make_sequence_key(kAnchorEventPrefix, 256);
  EXPECT_LT(low, high);
  EXPECT_EQ(try_parse_sequence_key(kAnchorEventPrefix, view(high)).value_or(0),
            256u);
  EXPECT_FALSE(try_parse_sequence_key(kReceiptEventPrefix, view(high))
                   .has_value());
}

TEST(state_keys, hash_and_role_keys_parse_back) {
  using namespace canon::schema::key;
  auto key = make_hash_key(kAnchorRegistryPrefix, make_hash(7));
  auto parsed = try_parse_hash_key(kAnchorRegistryPrefix, view(key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, make_hash(7));
  key.pop_back();
  EXPECT_FALSE(try_parse_hash_key(kAnchorRegistryPrefix, view(key)).has_value());

  auto role_key = make_role_key(kReceiptRolePrefix,
                                canon::schema::role_id_t::minter, make_hash(9));
  auto member = try_parse_role_key(kReceiptRolePrefix, view(role_key));
  ASSERT_TRUE(member.has_value());
  EXPECT_EQ(member->first, canon::schema::role_id_t::minter);
  EXPECT_EQ(member->second, make_hash(9));
}
