#pragma once

#include <canon/ledger/access_control.hpp>
#include <canon/ledger/nonce_authority.hpp>
#include <canon/ledger/signature_verifier.hpp>
#include <canon/schema/call_result.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/schema/role_id.hpp>
#include <canon/schema/signed_anchor_request.hpp>

#include <string_view>

namespace canon::ledger {

inline constexpr auto kAuthorizerCodespace =
    std::string_view{"canon.authorizer"};

/// Typed, domain-separated encoding of every request field except the
/// signature itself. The nonce and signer key are part of the payload.
canon::schema::bytes_t signing_payload(
    const canon::schema::signing_domain_t& domain,
    const canon::schema::signed_anchor_request_t& request);

/// 32-byte digest the signer signs: BLAKE3 over the signing payload.
canon::schema::hash32_t signing_digest(
    const canon::schema::signing_domain_t& domain,
    const canon::schema::signed_anchor_request_t& request);

/// Resolves who an anchor is attributed to.
///
/// Direct calls resolve to the caller once its role is confirmed. Meta calls
/// resolve to the principal of the verified signer; the executor that
/// submitted the request never participates in the nonce lookup.
class anchor_authorizer final {
 public:
  anchor_authorizer(const canon::schema::signing_domain_t& domain,
                    nonce_authority& nonces,
                    const access_control& roles);

  /// Replace the signature check (defaults to canon::crypto).
  void set_signature_verifier(signature_verifier_t verifier);

  canon::schema::call_result<canon::schema::principal_t> verify_direct(
      const canon::schema::principal_t& caller,
      canon::schema::role_id_t required_role) const;

  /// Verify signature, deadline and nonce, then advance the signer's nonce.
  /// Nothing is mutated unless every check passes.
  canon::schema::call_result<canon::schema::principal_t> verify_meta(
      const canon::schema::signed_anchor_request_t& request,
      const canon::schema::principal_t& executor,
      canon::schema::timestamp_milliseconds_t now);

  const canon::schema::signing_domain_t& domain() const;

 private:
  canon::schema::signing_domain_t domain_;
  nonce_authority& nonces_;
  const access_control& roles_;
  signature_verifier_t verifier_;
};

}  // namespace canon::ledger
