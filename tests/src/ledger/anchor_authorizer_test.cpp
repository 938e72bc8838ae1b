#include <canon/crypto/verify.hpp>
#include <canon/ledger/access_control.hpp>
#include <canon/ledger/anchor_authorizer.hpp>
#include <canon/ledger/nonce_authority.hpp>
#include <canon/testing/ledger_fixture.hpp>
#include <canon/testing/signing.hpp>
#include <gtest/gtest.h>

using canon::schema::error_code;
using canon::schema::role_id_t;
using canon::testing::make_fields;
using canon::testing::make_hash;
using canon::testing::test_domain;

namespace {

constexpr auto kNow = uint64_t{1'700'000'000'000};
constexpr auto kDeadline = kNow + 3'600'000;

class anchor_authorizer_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!canon::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
    }
    ASSERT_TRUE(key_.valid());
  }

  canon::ledger::nonce_authority nonces_;
  canon::ledger::access_control roles_{make_hash(0xA0)};
  canon::ledger::anchor_authorizer authorizer_{test_domain(), nonces_, roles_};
  canon::testing::ed25519_key key_;
};

}  // namespace

TEST(anchor_authorizer_digest, binds_nonce_and_domain) {
  auto request = canon::schema::signed_anchor_request_t{};
  request.fields = make_fields(1);
  request.deadline = kDeadline;
  request.signer = canon::schema::ed25519_signer_id{};

  auto base = canon::ledger::signing_digest(test_domain(), request);
  EXPECT_EQ(base, canon::ledger::signing_digest(test_domain(), request));

  auto renonced = request;
  renonced.nonce = 1;
  EXPECT_NE(base, canon::ledger::signing_digest(test_domain(), renonced));

  auto other_domain = test_domain();
  other_domain.registry_id = make_hash(0x03);
  EXPECT_NE(base, canon::ledger::signing_digest(other_domain, request));

  auto reassured = request;
  reassured.assurance_level = 2;
  EXPECT_NE(base, canon::ledger::signing_digest(test_domain(), reassured));

  auto resigned = request;
  resigned.signature = canon::schema::ed25519_signature_t{0x01};
  EXPECT_EQ(base, canon::ledger::signing_digest(test_domain(), resigned));
}

TEST_F(anchor_authorizer_test, verified_request_advances_signer_nonce) {
  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 0, kDeadline);

  auto result = authorizer_.verify_meta(request, make_hash(0x11), kNow);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.value, key_.principal());
  EXPECT_EQ(nonces_.current_nonce(key_.principal()), 1u);
  EXPECT_EQ(nonces_.current_nonce(make_hash(0x11)), 0u);
}

TEST_F(anchor_authorizer_test, second_executor_cannot_replay_consumed_nonce) {
  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 0, kDeadline);
  ASSERT_TRUE(authorizer_.verify_meta(request, make_hash(0x11), kNow).ok());

  auto replay = authorizer_.verify_meta(request, make_hash(0x22), kNow);
  EXPECT_EQ(replay.code, error_code::nonce_mismatch);
  EXPECT_EQ(replay.codespace, "canon.authorizer");
  EXPECT_EQ(nonces_.current_nonce(key_.principal()), 1u);
  EXPECT_EQ(nonces_.current_nonce(make_hash(0x22)), 0u);

  auto same_executor = authorizer_.verify_meta(request, make_hash(0x11), kNow);
  EXPECT_EQ(same_executor.code, error_code::nonce_mismatch);
}

TEST_F(anchor_authorizer_test, executor_nonce_never_satisfies_signer_check) {
  // The executor has its own history; a request carrying the executor's
  // nonce is still checked against the signer's counter.
  auto executor_key = canon::testing::ed25519_key{};
  ASSERT_TRUE(executor_key.valid());
  for (auto nonce = uint64_t{0}; nonce < 3; ++nonce) {
    auto own = canon::testing::make_signed_request(
        executor_key, test_domain(), make_fields(static_cast<uint8_t>(nonce)),
        0, nonce, kDeadline);
    ASSERT_TRUE(
        authorizer_.verify_meta(own, executor_key.principal(), kNow).ok());
  }

  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(9), 0, 3, kDeadline);
  auto result =
      authorizer_.verify_meta(request, executor_key.principal(), kNow);
  EXPECT_EQ(result.code, error_code::nonce_mismatch);
  EXPECT_EQ(nonces_.current_nonce(key_.principal()), 0u);
  EXPECT_EQ(nonces_.current_nonce(executor_key.principal()), 3u);
}

TEST_F(anchor_authorizer_test, expired_request_is_rejected_without_advance) {
  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 0, kNow - 1);
  auto result = authorizer_.verify_meta(request, make_hash(0x11), kNow);
  EXPECT_EQ(result.code, error_code::expired_request);
  EXPECT_EQ(nonces_.current_nonce(key_.principal()), 0u);

  auto at_deadline = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 0, kNow);
  EXPECT_TRUE(authorizer_.verify_meta(at_deadline, make_hash(0x11), kNow).ok());
}

TEST_F(anchor_authorizer_test, future_nonce_is_rejected) {
  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 5, kDeadline);
  auto result = authorizer_.verify_meta(request, make_hash(0x11), kNow);
  EXPECT_EQ(result.code, error_code::nonce_mismatch);
  EXPECT_EQ(nonces_.current_nonce(key_.principal()), 0u);
}

TEST_F(anchor_authorizer_test, tampered_request_fails_signature_check) {
  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 0, kDeadline);

  auto swapped_nonce = request;
  swapped_nonce.nonce = 1;
  EXPECT_EQ(authorizer_.verify_meta(swapped_nonce, make_hash(0x11), kNow).code,
            error_code::invalid_signature);

  auto swapped_digest = request;
  swapped_digest.fields.subject_tag = make_hash(0x77);
  EXPECT_EQ(
      authorizer_.verify_meta(swapped_digest, make_hash(0x11), kNow).code,
      error_code::invalid_signature);

  auto other_domain = test_domain();
  other_domain.chain_id = make_hash(0x09);
  auto foreign = canon::testing::make_signed_request(
      key_, other_domain, make_fields(1), 1, 0, kDeadline);
  EXPECT_EQ(authorizer_.verify_meta(foreign, make_hash(0x11), kNow).code,
            error_code::invalid_signature);

  EXPECT_EQ(nonces_.current_nonce(key_.principal()), 0u);
}

TEST_F(anchor_authorizer_test, installed_verifier_replaces_crypto_check) {
  authorizer_.set_signature_verifier(
      [](const canon::schema::bytes_view_t&, const canon::schema::signer_id_t&,
         const canon::schema::signature_t&) { return false; });
  auto request = canon::testing::make_signed_request(
      key_, test_domain(), make_fields(1), 1, 0, kDeadline);
  EXPECT_EQ(authorizer_.verify_meta(request, make_hash(0x11), kNow).code,
            error_code::invalid_signature);
}

TEST_F(anchor_authorizer_test, direct_calls_require_role) {
  auto denied = authorizer_.verify_direct(make_hash(0x11), role_id_t::relayer);
  EXPECT_EQ(denied.code, error_code::unauthorized);

  auto allowed = authorizer_.verify_direct(make_hash(0xA0), role_id_t::admin);
  ASSERT_TRUE(allowed.ok());
  EXPECT_EQ(allowed.value, make_hash(0xA0));
}
