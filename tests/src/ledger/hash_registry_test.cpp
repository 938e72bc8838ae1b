#include <canon/ledger/hash_registry.hpp>
#include <canon/testing/common.hpp>
#include <gtest/gtest.h>

using canon::testing::make_hash;

TEST(hash_registry, unseen_digest_is_not_anchored) {
  auto registry = canon::ledger::hash_registry{};
  EXPECT_FALSE(registry.is_anchored(make_hash(1)));
  EXPECT_EQ(registry.last_anchor_block(make_hash(1)), 0u);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(hash_registry, record_marks_digest_with_block_height) {
  auto registry = canon::ledger::hash_registry{};
  registry.record(make_hash(1), 7);
  EXPECT_TRUE(registry.is_anchored(make_hash(1)));
  EXPECT_EQ(registry.last_anchor_block(make_hash(1)), 7u);
  EXPECT_FALSE(registry.is_anchored(make_hash(2)));
}

TEST(hash_registry, re_record_overwrites_height_without_duplicating) {
  auto registry = canon::ledger::hash_registry{};
  registry.record(make_hash(1), 7);
  registry.record(make_hash(1), 12);
  EXPECT_TRUE(registry.is_anchored(make_hash(1)));
  EXPECT_EQ(registry.last_anchor_block(make_hash(1)), 12u);
  EXPECT_EQ(registry.size(), 1u);
}
