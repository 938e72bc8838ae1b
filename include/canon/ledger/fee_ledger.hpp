#pragma once

#include <canon/schema/call_result.hpp>
#include <canon/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <string_view>
#include <unordered_map>

namespace canon::ledger {

inline constexpr uint32_t kFoundationFeeShare = 1;
inline constexpr uint32_t kFeeDenominator = 13;
inline constexpr auto kFeeCodespace = std::string_view{"canon.fees"};

struct fee_split_t final {
  canon::schema::amount_t foundation_share{};
  canon::schema::amount_t implementer_share{};
};

/// Foundation receives floor(amount / 13); the implementer receives the
/// remainder so the two shares always sum to amount.
fee_split_t split_fee(const canon::schema::amount_t& amount);

/// Host hook that delivers value to a principal. Returns false when the
/// recipient rejects the transfer.
using value_transfer_t =
    std::function<bool(const canon::schema::principal_t& recipient,
                       const canon::schema::amount_t& amount)>;

/// Pull-payment ledger for protocol fees.
///
/// Deposits are credited to the two treasury principals; value leaves only
/// through withdraw/emergency_withdraw, which debit before transferring and
/// restore the debit if the transfer is rejected. At every point
/// sum(pending) + total_withdrawn == total_deposited.
class fee_ledger final {
 public:
  using balances_t = std::unordered_map<canon::schema::principal_t,
                                        canon::schema::amount_t,
                                        canon::schema::hash32_hasher_t>;

  fee_ledger(const canon::schema::principal_t& foundation_treasury,
             const canon::schema::principal_t& implementer_treasury);

  void set_treasuries(const canon::schema::principal_t& foundation_treasury,
                      const canon::schema::principal_t& implementer_treasury);
  const canon::schema::principal_t& foundation_treasury() const;
  const canon::schema::principal_t& implementer_treasury() const;

  /// Split and credit one anchor payment.
  fee_split_t deposit(const canon::schema::amount_t& amount);

  /// Pay out the caller's full pending balance.
  canon::schema::call_result<canon::schema::amount_t> withdraw(
      const canon::schema::principal_t& principal,
      const value_transfer_t& transfer);

  /// Sweep everything the ledger holds to recipient, clearing all pending
  /// balances.
  canon::schema::call_result<canon::schema::amount_t> emergency_withdraw(
      const canon::schema::principal_t& recipient,
      const value_transfer_t& transfer);

  canon::schema::amount_t pending_balance(
      const canon::schema::principal_t& principal) const;
  const canon::schema::amount_t& held_balance() const;
  const canon::schema::amount_t& total_deposited() const;
  const canon::schema::amount_t& total_withdrawn() const;
  const balances_t& balances() const;

  /// Reinstall persisted totals and balances at startup.
  void restore(const canon::schema::amount_t& held,
               const canon::schema::amount_t& total_deposited,
               const canon::schema::amount_t& total_withdrawn,
               balances_t balances);

 private:
  canon::schema::principal_t foundation_treasury_;
  canon::schema::principal_t implementer_treasury_;
  balances_t balances_;
  canon::schema::amount_t held_{};
  canon::schema::amount_t total_deposited_{};
  canon::schema::amount_t total_withdrawn_{};
};

}  // namespace canon::ledger
