#pragma once

#include <canon/schema/call_result.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/schema/role_id.hpp>

#include <set>
#include <string_view>
#include <utility>

namespace canon::ledger {

inline constexpr auto kRolesCodespace = std::string_view{"canon.roles"};

/// Role membership for direct (non-meta) calls. Only admins manage roles;
/// any member may renounce its own role.
class access_control final {
 public:
  using membership_t =
      std::set<std::pair<canon::schema::role_id_t, canon::schema::principal_t>>;

  explicit access_control(const canon::schema::principal_t& admin);

  bool has_role(canon::schema::role_id_t role,
                const canon::schema::principal_t& account) const;

  /// Reject with unauthorized unless account holds role.
  canon::schema::call_result<> require(
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account) const;

  /// Value is true when membership changed.
  canon::schema::call_result<bool> grant_role(
      const canon::schema::principal_t& sender,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account);
  canon::schema::call_result<bool> revoke_role(
      const canon::schema::principal_t& sender,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account);
  canon::schema::call_result<bool> renounce_role(
      const canon::schema::principal_t& sender,
      canon::schema::role_id_t role,
      const canon::schema::principal_t& account);

  const membership_t& members() const;
  void restore(membership_t members);

 private:
  membership_t members_;
};

}  // namespace canon::ledger
