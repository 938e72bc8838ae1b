#pragma once

#include <canon/schema/primitives.hpp>

namespace canon::crypto {

/// True when the OpenSSL build exposes both ed25519 and secp256k1.
bool available();

bool verify_signature(const canon::schema::bytes_view_t& message,
                      const canon::schema::signer_id_t& signer,
                      const canon::schema::signature_t& signature);

/// Principal a signer key acts as: BLAKE3 over the key-type tag and the raw
/// public key bytes.
canon::schema::principal_t principal_of(
    const canon::schema::signer_id_t& signer);

}  // namespace canon::crypto
