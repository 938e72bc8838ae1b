#include <canon/relay/receipt_issuer.hpp>
#include <canon/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <variant>

using canon::schema::anchored_event_t;
using canon::testing::admin_principal;
using canon::testing::make_fields;
using canon::testing::make_hash;

namespace {

constexpr auto kNow = uint64_t{1'700'000'000'000};

const auto kBaseFee = canon::execution::kDefaultBaseFee;

canon::relay::receipt_issuer_options issuer_options() {
  return canon::relay::receipt_issuer_options{.minter = admin_principal(),
                                              .auto_mint = true};
}

anchored_event_t committed_anchor(canon::execution::anchor_engine& engine) {
  for (const auto& record : engine.events()) {
    if (const auto* anchored = std::get_if<anchored_event_t>(&record.event)) {
      return *anchored;
    }
  }
  return anchored_event_t{};
}

}  // namespace

TEST(receipt_issuer, content_hash_depends_on_anchor_contents) {
  auto event = anchored_event_t{};
  auto fields = make_fields(1);
  event.warrant_digest = fields.warrant_digest;
  event.attestation_digest = fields.attestation_digest;
  event.timestamp = kNow;

  auto base = canon::relay::receipt_content_hash(event);
  EXPECT_EQ(base, canon::relay::receipt_content_hash(event));

  auto later = event;
  later.timestamp = kNow + 1;
  EXPECT_NE(base, canon::relay::receipt_content_hash(later));

  auto other_fee = event;
  other_fee.fee = 7;
  EXPECT_EQ(base, canon::relay::receipt_content_hash(other_fee));
}

TEST(receipt_issuer, mints_receipt_when_anchor_commits) {
  auto fixture = canon::testing::ledger_fixture{"canon_issuer_auto"};
  auto issuer = canon::relay::receipt_issuer{fixture.token(), issuer_options()};
  issuer.attach(fixture.engine());

  fixture.begin_block(1, kNow);
  ASSERT_TRUE(fixture.engine()
                  .anchor(admin_principal(), make_fields(1), 1, kBaseFee)
                  .ok());
  EXPECT_EQ(fixture.token().total_minted(), 0u);
  fixture.commit();

  EXPECT_EQ(issuer.stats().minted, 1u);
  EXPECT_EQ(fixture.token().total_minted(), 1u);
  EXPECT_EQ(fixture.token().owner_of(1).value, admin_principal());

  auto expected =
      canon::relay::receipt_content_hash(committed_anchor(fixture.engine()));
  EXPECT_TRUE(fixture.token().is_minted(expected));
  EXPECT_EQ(fixture.token().last_committed().height, 1u);
}

TEST(receipt_issuer, duplicate_issue_resolves_to_existing_token) {
  auto fixture = canon::testing::ledger_fixture{"canon_issuer_duplicate"};
  auto issuer = canon::relay::receipt_issuer{fixture.token(), issuer_options()};
  issuer.attach(fixture.engine());

  fixture.begin_block(1, kNow);
  ASSERT_TRUE(fixture.engine()
                  .anchor(admin_principal(), make_fields(1), 0, kBaseFee)
                  .ok());
  fixture.commit();

  fixture.begin_block(2, kNow + 1000);
  auto again = issuer.issue(committed_anchor(fixture.engine()));
  ASSERT_TRUE(again.ok()) << again.log;
  EXPECT_EQ(again.value, 1u);
  EXPECT_EQ(issuer.stats().duplicates, 1u);
  EXPECT_EQ(fixture.token().total_minted(), 1u);
}

TEST(receipt_issuer, skips_anchors_while_auto_mint_is_off) {
  auto fixture = canon::testing::ledger_fixture{"canon_issuer_skip"};
  auto issuer = canon::relay::receipt_issuer{fixture.token(), issuer_options()};
  issuer.attach(fixture.engine());
  issuer.set_auto_mint(false);
  EXPECT_FALSE(issuer.auto_mint());

  fixture.begin_block(1, kNow);
  ASSERT_TRUE(fixture.engine()
                  .anchor(admin_principal(), make_fields(1), 0, kBaseFee)
                  .ok());
  ASSERT_TRUE(fixture.engine().pause(admin_principal()).ok());
  fixture.commit();

  EXPECT_EQ(issuer.stats().skipped, 1u);
  EXPECT_EQ(issuer.stats().minted, 0u);
  EXPECT_EQ(fixture.token().total_minted(), 0u);
}

TEST(receipt_issuer, counts_rejected_mints) {
  auto fixture =
      canon::testing::ledger_fixture{"canon_issuer_disabled", false};
  auto issuer = canon::relay::receipt_issuer{fixture.token(), issuer_options()};
  issuer.attach(fixture.engine());

  fixture.begin_block(1, kNow);
  ASSERT_TRUE(fixture.engine()
                  .anchor(admin_principal(), make_fields(1), 0, kBaseFee)
                  .ok());
  fixture.commit();

  EXPECT_EQ(issuer.stats().failures, 1u);
  EXPECT_EQ(fixture.token().total_minted(), 0u);
  EXPECT_EQ(fixture.engine().total_anchors(), 1u);
}

TEST(receipt_issuer, detached_issuer_no_longer_mints) {
  auto fixture = canon::testing::ledger_fixture{"canon_issuer_detach"};
  {
    auto scoped =
        canon::relay::receipt_issuer{fixture.token(), issuer_options()};
    scoped.attach(fixture.engine());
    EXPECT_TRUE(scoped.attached());
  }

  auto issuer = canon::relay::receipt_issuer{fixture.token(), issuer_options()};
  issuer.attach(fixture.engine());
  issuer.attach(fixture.engine());

  fixture.begin_block(1, kNow);
  ASSERT_TRUE(fixture.engine()
                  .anchor(admin_principal(), make_fields(1), 0, kBaseFee)
                  .ok());
  fixture.commit();
  EXPECT_EQ(issuer.stats().minted, 1u);
  EXPECT_EQ(issuer.stats().duplicates, 0u);
  EXPECT_EQ(fixture.token().total_minted(), 1u);

  issuer.detach();
  EXPECT_FALSE(issuer.attached());
  fixture.begin_block(2, kNow + 1000);
  ASSERT_TRUE(fixture.engine()
                  .anchor(admin_principal(), make_fields(2), 0, kBaseFee)
                  .ok());
  fixture.commit();
  EXPECT_EQ(issuer.stats().minted, 1u);
  EXPECT_EQ(fixture.token().total_minted(), 1u);
}
