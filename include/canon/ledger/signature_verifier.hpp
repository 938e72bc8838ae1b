#pragma once

#include <canon/schema/primitives.hpp>
#include <functional>

namespace canon::ledger {

using signature_verifier_t =
    std::function<bool(const canon::schema::bytes_view_t& message,
                       const canon::schema::signer_id_t& signer,
                       const canon::schema::signature_t& signature)>;

}  // namespace canon::ledger
