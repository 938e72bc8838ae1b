#pragma once

#include <canon/crypto/verify.hpp>
#include <canon/ledger/anchor_authorizer.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/schema/signed_anchor_request.hpp>
#include <openssl/evp.h>

#include <cstdint>
#include <memory>

namespace canon::testing {

/// Throwaway ed25519 key pair backed by OpenSSL.
class ed25519_key final {
 public:
  ed25519_key() : key_{nullptr, &EVP_PKEY_free} {
    auto* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (ctx == nullptr) {
      return;
    }
    EVP_PKEY* raw{nullptr};
    if (EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &raw) == 1) {
      key_.reset(raw);
    }
    EVP_PKEY_CTX_free(ctx);
    if (!key_) {
      return;
    }
    auto size = public_key_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), public_key_.public_key.data(),
                                    &size) != 1 ||
        size != public_key_.public_key.size()) {
      key_.reset();
    }
  }

  bool valid() const { return static_cast<bool>(key_); }

  canon::schema::signer_id_t signer() const {
    return canon::schema::signer_id_t{public_key_};
  }

  canon::schema::principal_t principal() const {
    return canon::crypto::principal_of(signer());
  }

  canon::schema::ed25519_signature_t sign(
      const canon::schema::bytes_view_t& message) const {
    auto signature = canon::schema::ed25519_signature_t{};
    auto* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
      return signature;
    }
    auto size = signature.size();
    if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key_.get()) != 1 ||
        EVP_DigestSign(ctx, signature.data(), &size, message.data(),
                       message.size()) != 1) {
      signature.fill(0);
    }
    EVP_MD_CTX_free(ctx);
    return signature;
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  canon::schema::ed25519_signer_id public_key_{};
};

/// Build a request and sign its signing digest under domain.
inline canon::schema::signed_anchor_request_t make_signed_request(
    const ed25519_key& key,
    const canon::schema::signing_domain_t& domain,
    const canon::schema::anchor_fields_t& fields,
    const uint8_t assurance_level,
    const uint64_t nonce,
    const canon::schema::timestamp_milliseconds_t deadline) {
  auto request = canon::schema::signed_anchor_request_t{};
  request.fields = fields;
  request.assurance_level = assurance_level;
  request.nonce = nonce;
  request.deadline = deadline;
  request.signer = key.signer();
  auto digest = canon::ledger::signing_digest(domain, request);
  request.signature = key.sign(
      canon::schema::bytes_view_t{digest.data(), digest.size()});
  return request;
}

}  // namespace canon::testing
