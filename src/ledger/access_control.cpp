#include <canon/ledger/access_control.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

using namespace canon::schema;

namespace canon::ledger {

access_control::access_control(const principal_t& admin) {
  members_.emplace(role_id_t::admin, admin);
}

bool access_control::has_role(const role_id_t role,
                              const principal_t& account) const {
  return members_.contains({role, account});
}

call_result<> access_control::require(const role_id_t role,
                                      const principal_t& account) const {
  if (!has_role(role, account)) {
    return make_failure(error_code::unauthorized, kRolesCodespace,
                        fmt::format("account {} is missing role {}",
                                    to_hex(account), to_string(role)));
  }
  return make_success();
}

call_result<bool> access_control::grant_role(const principal_t& sender,
                                             const role_id_t role,
                                             const principal_t& account) {
  if (auto allowed = require(role_id_t::admin, sender); !allowed.ok()) {
    return forward_failure<bool>(allowed);
  }
  auto [_, inserted] = members_.emplace(role, account);
  if (inserted) {
    spdlog::info("Granted role {} to {}", to_string(role), to_hex(account));
  }
  return make_success(inserted);
}

call_result<bool> access_control::revoke_role(const principal_t& sender,
                                              const role_id_t role,
                                              const principal_t& account) {
  if (auto allowed = require(role_id_t::admin, sender); !allowed.ok()) {
    return forward_failure<bool>(allowed);
  }
  auto removed = members_.erase({role, account}) > 0;
  if (removed) {
    spdlog::info("Revoked role {} from {}", to_string(role), to_hex(account));
  }
  return make_success(removed);
}

call_result<bool> access_control::renounce_role(const principal_t& sender,
                                                const role_id_t role,
                                                const principal_t& account) {
  if (sender != account) {
    return make_failure<bool>(error_code::unauthorized, kRolesCodespace,
                              "roles can only be renounced for self");
  }
  auto removed = members_.erase({role, account}) > 0;
  if (removed) {
    spdlog::info("Account {} renounced role {}", to_hex(account),
                 to_string(role));
  }
  return make_success(removed);
}

const access_control::membership_t& access_control::members() const {
  return members_;
}

void access_control::restore(membership_t members) {
  members_ = std::move(members);
}

}  // namespace canon::ledger
