#include <canon/ledger/access_control.hpp>
#include <canon/testing/common.hpp>
#include <gtest/gtest.h>

using canon::schema::error_code;
using canon::schema::role_id_t;
using canon::testing::make_hash;

TEST(access_control, constructor_seats_admin) {
  auto roles = canon::ledger::access_control{make_hash(1)};
  EXPECT_TRUE(roles.has_role(role_id_t::admin, make_hash(1)));
  EXPECT_FALSE(roles.has_role(role_id_t::relayer, make_hash(1)));
  EXPECT_TRUE(roles.require(role_id_t::admin, make_hash(1)).ok());

  auto denied = roles.require(role_id_t::admin, make_hash(2));
  EXPECT_EQ(denied.code, error_code::unauthorized);
  EXPECT_EQ(denied.codespace, "canon.roles");
}

TEST(access_control, only_admin_grants_and_revokes) {
  auto roles = canon::ledger::access_control{make_hash(1)};

  auto denied = roles.grant_role(make_hash(2), role_id_t::relayer, make_hash(2));
  EXPECT_EQ(denied.code, error_code::unauthorized);
  EXPECT_FALSE(roles.has_role(role_id_t::relayer, make_hash(2)));

  auto granted = roles.grant_role(make_hash(1), role_id_t::relayer, make_hash(2));
  ASSERT_TRUE(granted.ok());
  EXPECT_TRUE(granted.value);
  EXPECT_TRUE(roles.has_role(role_id_t::relayer, make_hash(2)));

  auto again = roles.grant_role(make_hash(1), role_id_t::relayer, make_hash(2));
  ASSERT_TRUE(again.ok());
  EXPECT_FALSE(again.value);

  EXPECT_EQ(
      roles.revoke_role(make_hash(2), role_id_t::relayer, make_hash(2)).code,
      error_code::unauthorized);
  auto revoked = roles.revoke_role(make_hash(1), role_id_t::relayer, make_hash(2));
  ASSERT_TRUE(revoked.ok());
  EXPECT_TRUE(revoked.value);
  EXPECT_FALSE(roles.has_role(role_id_t::relayer, make_hash(2)));
}

TEST(access_control, renounce_is_limited_to_self) {
  auto roles = canon::ledger::access_control{make_hash(1)};
  ASSERT_TRUE(
      roles.grant_role(make_hash(1), role_id_t::minter, make_hash(3)).ok());

  auto denied =
      roles.renounce_role(make_hash(1), role_id_t::minter, make_hash(3));
  EXPECT_EQ(denied.code, error_code::unauthorized);
  EXPECT_TRUE(roles.has_role(role_id_t::minter, make_hash(3)));

  auto renounced =
      roles.renounce_role(make_hash(3), role_id_t::minter, make_hash(3));
  ASSERT_TRUE(renounced.ok());
  EXPECT_TRUE(renounced.value);
  EXPECT_FALSE(roles.has_role(role_id_t::minter, make_hash(3)));
}

TEST(access_control, restore_replaces_membership) {
  auto roles = canon::ledger::access_control{make_hash(1)};
  auto members = canon::ledger::access_control::membership_t{
      {role_id_t::admin, make_hash(5)}, {role_id_t::relayer, make_hash(6)}};
  roles.restore(members);
  EXPECT_FALSE(roles.has_role(role_id_t::admin, make_hash(1)));
  EXPECT_TRUE(roles.has_role(role_id_t::admin, make_hash(5)));
  EXPECT_TRUE(roles.has_role(role_id_t::relayer, make_hash(6)));
  EXPECT_EQ(roles.members(), members);
}
