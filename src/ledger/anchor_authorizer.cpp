#include <canon/blake3/hash.hpp>
#include <canon/crypto/verify.hpp>
#include <canon/ledger/anchor_authorizer.hpp>
#include <canon/schema/encoding/scale/encoder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <tuple>
#include <utility>

using namespace canon::schema;

namespace canon::ledger {

namespace {

constexpr auto kRequestTypeName = std::string_view{"canon.anchor_request"};
constexpr auto kSigningDomainTag = std::string_view{"canon.anchor.signing.v1|"};

bytes_t signer_key_bytes(const signer_id_t& signer) {
  auto out = bytes_t{};
  std::visit(overloaded{[&](const ed25519_signer_id& value) {
                          out.push_back(uint8_t{0});
                          out.insert(std::end(out), std::begin(value.public_key),
                                     std::end(value.public_key));
                        },
                        [&](const secp256k1_signer_id& value) {
                          out.push_back(uint8_t{1});
                          out.insert(std::end(out), std::begin(value.public_key),
                                     std::end(value.public_key));
                        }},
             signer);
  return out;
}

}  // namespace

bytes_t signing_payload(const signing_domain_t& domain,
                        const signed_anchor_request_t& request) {
  auto encoder = encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{
      std::string{kRequestTypeName}, request.version, domain.chain_id,
      domain.registry_id, request.fields.warrant_digest,
      request.fields.attestation_digest, request.fields.subject_tag,
      request.fields.controller_did_hash, request.assurance_level,
      request.nonce, request.deadline, signer_key_bytes(request.signer)});
}

hash32_t signing_digest(const signing_domain_t& domain,
                        const signed_anchor_request_t& request) {
  auto payload = signing_payload(domain, request);
  return canon::blake3::hash(kSigningDomainTag,
                             bytes_view_t{payload.data(), payload.size()});
}

anchor_authorizer::anchor_authorizer(const signing_domain_t& domain,
                                     nonce_authority& nonces,
                                     const access_control& roles)
    : domain_{domain},
      nonces_{nonces},
      roles_{roles},
      verifier_{canon::crypto::verify_signature} {}

void anchor_authorizer::set_signature_verifier(signature_verifier_t verifier) {
  verifier_ = std::move(verifier);
}

call_result<principal_t> anchor_authorizer::verify_direct(
    const principal_t& caller,
    const role_id_t required_role) const {
  if (auto allowed = roles_.require(required_role, caller); !allowed.ok()) {
    return forward_failure<principal_t>(allowed);
  }
  return make_success(caller);
}

call_result<principal_t> anchor_authorizer::verify_meta(
    const signed_anchor_request_t& request,
    const principal_t& executor,
    const timestamp_milliseconds_t now) {
  auto digest = signing_digest(domain_, request);
  if (!verifier_ || !verifier_(bytes_view_t{digest.data(), digest.size()},
                               request.signer, request.signature)) {
    return make_failure<principal_t>(error_code::invalid_signature,
                                     kAuthorizerCodespace,
                                     "signature does not match signer");
  }
  auto signer = canon::crypto::principal_of(request.signer);

  if (now > request.deadline) {
    return make_failure<principal_t>(
        error_code::expired_request, kAuthorizerCodespace,
        fmt::format("request deadline {} passed at {}", request.deadline,
                    now));
  }

  auto expected = nonces_.current_nonce(signer);
  if (request.nonce != expected) {
    return make_failure<principal_t>(
        error_code::nonce_mismatch, kAuthorizerCodespace,
        fmt::format("nonce {} does not match signer nonce {}", request.nonce,
                    expected));
  }

  auto next = nonces_.advance(signer);
  spdlog::debug("Signer {} authorized via executor {}; nonce now {}",
                to_hex(signer), to_hex(executor), next);
  return make_success(signer);
}

const signing_domain_t& anchor_authorizer::domain() const {
  return domain_;
}

}  // namespace canon::ledger
