#include <canon/blake3/hash.hpp>
#include <canon/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace canon::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

constexpr auto kPrincipalDomain = std::string_view{"canon.principal.v1|"};

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool verify_ed25519(const canon::schema::bytes_view_t& message,
                    const canon::schema::ed25519_signer_id& signer,
                    const canon::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<std::array<uint8_t, 64>> compact_secp_signature(
    const canon::schema::secp256k1_signature_t& signature) {
  // 65-byte encodings carry the recovery id either first [v || r || s] or
  // last [r || s || v]. Accept 0..3 and the legacy 27+ form; 4..26 is
  // rejected.
  auto out = std::array<uint8_t, 64>{};
  if (signature[0] <= 3 || signature[0] >= 27) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (signature[64] <= 3 || signature[64] >= 27) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

bool verify_secp256k1(const canon::schema::bytes_view_t& message,
                      const canon::schema::secp256k1_signer_id& signer,
                      const canon::schema::secp256k1_signature_t& signature) {
  auto compact = compact_secp_signature(signature);
  if (!compact.has_value()) {
    return false;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r = bignum_ptr{BN_bin2bn(compact->data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact->data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return false;
  }
  // ECDSA_SIG_set0 took ownership.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

bool verify_signature(const canon::schema::bytes_view_t& message,
                      const canon::schema::signer_id_t& signer,
                      const canon::schema::signature_t& signature) {
  auto verified = false;
  std::visit(
      overloaded{
          [&](const canon::schema::ed25519_signer_id& value) {
            if (!std::holds_alternative<canon::schema::ed25519_signature_t>(
                    signature)) {
              verified = false;
              return;
            }
            verified = verify_ed25519(
                message, value,
                std::get<canon::schema::ed25519_signature_t>(signature));
          },
          [&](const canon::schema::secp256k1_signer_id& value) {
            if (!std::holds_alternative<canon::schema::secp256k1_signature_t>(
                    signature)) {
              verified = false;
              return;
            }
            verified = verify_secp256k1(
                message, value,
                std::get<canon::schema::secp256k1_signature_t>(signature));
          }},
      signer);
  return verified;
}

canon::schema::principal_t principal_of(
    const canon::schema::signer_id_t& signer) {
  auto material = canon::schema::bytes_t{};
  std::visit(overloaded{[&](const canon::schema::ed25519_signer_id& value) {
                          material.push_back(uint8_t{0});
                          material.insert(std::end(material),
                                          std::begin(value.public_key),
                                          std::end(value.public_key));
                        },
                        [&](const canon::schema::secp256k1_signer_id& value) {
                          material.push_back(uint8_t{1});
                          material.insert(std::end(material),
                                          std::begin(value.public_key),
                                          std::end(value.public_key));
                        }},
             signer);
  return canon::blake3::hash(
      kPrincipalDomain,
      canon::schema::bytes_view_t{material.data(), material.size()});
}

}  // namespace canon::crypto
