#include <canon/testing/ledger_fixture.hpp>
#include <canon/token/receipt_token.hpp>
#include <gtest/gtest.h>

using canon::schema::error_code;
using canon::schema::role_id_t;
using canon::testing::admin_principal;
using canon::testing::make_hash;

namespace {

constexpr auto kNow = uint64_t{1'700'000'000'000};

const auto kOwner = make_hash(0x31);
const auto kHolder = make_hash(0x32);

}  // namespace

TEST(receipt_token, ids_never_reused_after_burn) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_ids"};
  auto& token = fixture.token();
  auto h1 = make_hash(0x41);
  auto h2 = make_hash(0x42);
  fixture.begin_block(1, kNow);

  auto first = token.mint(admin_principal(), kOwner, h1);
  ASSERT_TRUE(first.ok()) << first.log;
  EXPECT_EQ(first.value, 1u);
  auto second = token.mint(admin_principal(), kHolder, h2);
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(second.value, 2u);

  ASSERT_TRUE(token.burn(kOwner, 1).ok());
  EXPECT_FALSE(token.is_minted(h1));
  EXPECT_EQ(token.owner_of(1).code, error_code::unknown_token);

  auto reminted = token.mint(admin_principal(), kOwner, h1);
  ASSERT_TRUE(reminted.ok()) << reminted.log;
  EXPECT_EQ(reminted.value, 3u);

  EXPECT_EQ(token.total_minted(), 3u);
  EXPECT_EQ(token.total_burned(), 1u);
  EXPECT_EQ(token.active_supply(), 2u);
  EXPECT_EQ(token.balance_of(kOwner), 1u);
  EXPECT_EQ(token.token_of(h1).value_or(0), 3u);
}

TEST(receipt_token, records_receipt_details) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_details"};
  auto& token = fixture.token();
  auto hash = make_hash(0x41);
  fixture.begin_block(1, kNow);

  ASSERT_TRUE(token.mint(admin_principal(), kOwner, hash).ok());
  EXPECT_EQ(token.owner_of(1).value, kOwner);
  EXPECT_EQ(token.content_hash(1).value, hash);
  EXPECT_EQ(token.mint_timestamp(1).value, kNow);
  EXPECT_EQ(token.original_minter(1).value, admin_principal());
  EXPECT_EQ(token.content_hash(9).code, error_code::unknown_token);
  EXPECT_EQ(token.name(), "Mask Receipt");
  EXPECT_EQ(token.symbol(), "MASKR");

  auto events = token.events();
  ASSERT_EQ(events.size(), 1u);
  const auto& minted =
      std::get<canon::schema::receipt_minted_event_t>(events[0].event);
  EXPECT_EQ(minted.token_id, 1u);
  EXPECT_EQ(minted.to, kOwner);
}

TEST(receipt_token, rejects_invalid_mints) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_invalid"};
  auto& token = fixture.token();
  auto hash = make_hash(0x41);
  fixture.begin_block(1, kNow);

  EXPECT_EQ(token.mint(make_hash(0x11), kOwner, hash).code,
            error_code::unauthorized);
  EXPECT_EQ(token.mint(admin_principal(), canon::schema::make_zero_hash(), hash)
                .code,
            error_code::zero_recipient);
  EXPECT_EQ(token.mint(admin_principal(), kOwner,
                       canon::schema::make_zero_hash())
                .code,
            error_code::invalid_content_hash);

  ASSERT_TRUE(token.mint(admin_principal(), kOwner, hash).ok());
  EXPECT_EQ(token.mint(admin_principal(), kHolder, hash).code,
            error_code::duplicate_content_hash);
  EXPECT_EQ(token.total_minted(), 1u);
  EXPECT_EQ(token.balance_of(kHolder), 0u);
}

TEST(receipt_token, minting_starts_disabled_until_toggled) {
  auto fixture =
      canon::testing::ledger_fixture{"canon_token_toggle", false};
  auto& token = fixture.token();
  fixture.begin_block(1, kNow);

  EXPECT_FALSE(token.minting_enabled());
  EXPECT_EQ(token.mint(admin_principal(), kOwner, make_hash(0x41)).code,
            error_code::minting_disabled);
  EXPECT_EQ(token.toggle_minting(make_hash(0x11), true).code,
            error_code::unauthorized);

  ASSERT_TRUE(token.toggle_minting(admin_principal(), true).ok());
  EXPECT_TRUE(token.mint(admin_principal(), kOwner, make_hash(0x41)).ok());
}

TEST(receipt_token, burn_requires_owner_or_admin) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_burn"};
  auto& token = fixture.token();
  fixture.begin_block(1, kNow);
  ASSERT_TRUE(token.mint(admin_principal(), kOwner, make_hash(0x41)).ok());
  ASSERT_TRUE(token.mint(admin_principal(), kOwner, make_hash(0x42)).ok());

  EXPECT_EQ(token.burn(kHolder, 1).code, error_code::unauthorized);
  EXPECT_EQ(token.burn(kOwner, 7).code, error_code::unknown_token);
  EXPECT_TRUE(token.burn(kOwner, 1).ok());
  EXPECT_TRUE(token.burn(admin_principal(), 2).ok());
  EXPECT_EQ(token.burn(kOwner, 1).code, error_code::unknown_token);
  EXPECT_EQ(token.balance_of(kOwner), 0u);
  EXPECT_EQ(token.active_supply(), 0u);
}

TEST(receipt_token, receipts_cannot_change_hands) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_soulbound"};
  auto& token = fixture.token();
  fixture.begin_block(1, kNow);
  ASSERT_TRUE(token.mint(admin_principal(), kOwner, make_hash(0x41)).ok());

  EXPECT_EQ(token.transfer_from(kOwner, kOwner, kHolder, 1).code,
            error_code::transfers_disabled);
  EXPECT_EQ(token.safe_transfer_from(kOwner, kOwner, kHolder, 1).code,
            error_code::transfers_disabled);
  EXPECT_EQ(token.approve(kOwner, kHolder, 1).code,
            error_code::transfers_disabled);
  EXPECT_EQ(token.set_approval_for_all(kOwner, kHolder, true).code,
            error_code::transfers_disabled);
  EXPECT_EQ(token.owner_of(1).value, kOwner);
}

TEST(receipt_token, pause_blocks_mint_and_burn) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_pause"};
  auto& token = fixture.token();
  fixture.begin_block(1, kNow);
  ASSERT_TRUE(token.mint(admin_principal(), kOwner, make_hash(0x41)).ok());

  ASSERT_TRUE(token.pause(admin_principal()).ok());
  EXPECT_EQ(token.mint(admin_principal(), kOwner, make_hash(0x42)).code,
            error_code::enforced_pause);
  EXPECT_EQ(token.burn(kOwner, 1).code, error_code::enforced_pause);
  ASSERT_TRUE(token.unpause(admin_principal()).ok());
  EXPECT_EQ(token.unpause(admin_principal()).code, error_code::expected_pause);
  EXPECT_TRUE(token.burn(kOwner, 1).ok());
}

TEST(receipt_token, minter_role_can_be_granted) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_roles"};
  auto& token = fixture.token();
  auto minter = make_hash(0x11);
  fixture.begin_block(1, kNow);

  ASSERT_TRUE(token.grant_role(admin_principal(), role_id_t::minter, minter)
                  .ok());
  EXPECT_TRUE(token.has_role(role_id_t::minter, minter));
  EXPECT_TRUE(token.mint(minter, kOwner, make_hash(0x41)).ok());

  ASSERT_TRUE(token.revoke_role(admin_principal(), role_id_t::minter, minter)
                  .ok());
  EXPECT_EQ(token.mint(minter, kOwner, make_hash(0x42)).code,
            error_code::unauthorized);
}

TEST(receipt_token, committed_receipts_survive_reopen) {
  auto fixture = canon::testing::ledger_fixture{"canon_token_reopen"};
  fixture.begin_block(1, kNow);
  ASSERT_TRUE(
      fixture.token().mint(admin_principal(), kOwner, make_hash(0x41)).ok());
  ASSERT_TRUE(
      fixture.token().mint(admin_principal(), kHolder, make_hash(0x42)).ok());
  ASSERT_TRUE(fixture.token().burn(kOwner, 1).ok());
  fixture.commit();

  fixture.reopen();
  auto& token = fixture.token();
  EXPECT_EQ(token.total_minted(), 2u);
  EXPECT_EQ(token.total_burned(), 1u);
  EXPECT_EQ(token.active_supply(), 1u);
  EXPECT_EQ(token.owner_of(2).value, kHolder);
  EXPECT_EQ(token.balance_of(kHolder), 1u);
  EXPECT_TRUE(token.minting_enabled());
  EXPECT_TRUE(token.has_role(role_id_t::minter, admin_principal()));
  EXPECT_EQ(token.events().size(), 3u);

  fixture.begin_block(2, kNow + 1000);
  auto next = token.mint(admin_principal(), kOwner, make_hash(0x41));
  ASSERT_TRUE(next.ok()) << next.log;
  EXPECT_EQ(next.value, 3u);
}
