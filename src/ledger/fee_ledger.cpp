#include <canon/ledger/fee_ledger.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace canon::schema;

namespace canon::ledger {

fee_split_t split_fee(const amount_t& amount) {
  auto split = fee_split_t{};
  split.foundation_share = (amount * kFoundationFeeShare) / kFeeDenominator;
  split.implementer_share = amount - split.foundation_share;
  return split;
}

fee_ledger::fee_ledger(const principal_t& foundation_treasury,
                       const principal_t& implementer_treasury)
    : foundation_treasury_{foundation_treasury},
      implementer_treasury_{implementer_treasury} {}

void fee_ledger::set_treasuries(const principal_t& foundation_treasury,
                                const principal_t& implementer_treasury) {
  foundation_treasury_ = foundation_treasury;
  implementer_treasury_ = implementer_treasury;
}

const principal_t& fee_ledger::foundation_treasury() const {
  return foundation_treasury_;
}

const principal_t& fee_ledger::implementer_treasury() const {
  return implementer_treasury_;
}

fee_split_t fee_ledger::deposit(const amount_t& amount) {
  auto split = split_fee(amount);
  balances_[foundation_treasury_] += split.foundation_share;
  balances_[implementer_treasury_] += split.implementer_share;
  held_ += amount;
  total_deposited_ += amount;
  return split;
}

call_result<amount_t> fee_ledger::withdraw(const principal_t& principal,
                                           const value_transfer_t& transfer) {
  auto it = balances_.find(principal);
  if (it == std::end(balances_) || it->second == 0) {
    return make_failure<amount_t>(error_code::no_balance, kFeeCodespace,
                                  "no pending balance to withdraw");
  }

  // Debit first: a reentrant call observing this state sees a zero balance.
  auto amount = it->second;
  balances_.erase(it);
  held_ -= amount;
  total_withdrawn_ += amount;

  if (!transfer || !transfer(principal, amount)) {
    balances_[principal] += amount;
    held_ += amount;
    total_withdrawn_ -= amount;
    spdlog::warn("Withdrawal of {} to {} rejected; balance restored",
                 canon::schema::to_string(amount), to_hex(principal));
    return make_failure<amount_t>(error_code::transfer_failed, kFeeCodespace,
                                  "recipient rejected the transfer");
  }

  spdlog::info("Withdrew {} to {}", canon::schema::to_string(amount),
               to_hex(principal));
  return make_success(amount);
}

call_result<amount_t> fee_ledger::emergency_withdraw(
    const principal_t& recipient,
    const value_transfer_t& transfer) {
  if (held_ == 0) {
    return make_failure<amount_t>(error_code::no_balance, kFeeCodespace,
                                  "ledger holds no value");
  }

  auto amount = held_;
  auto swept = balances_t{};
  swept.swap(balances_);
  held_ = 0;
  total_withdrawn_ += amount;

  if (!transfer || !transfer(recipient, amount)) {
    balances_ = std::move(swept);
    held_ = amount;
    total_withdrawn_ -= amount;
    spdlog::warn("Emergency sweep of {} to {} rejected; balances restored",
                 canon::schema::to_string(amount), to_hex(recipient));
    return make_failure<amount_t>(error_code::transfer_failed, kFeeCodespace,
                                  "recipient rejected the transfer");
  }

  spdlog::warn("Emergency sweep moved {} to {}",
               canon::schema::to_string(amount), to_hex(recipient));
  return make_success(amount);
}

amount_t fee_ledger::pending_balance(const principal_t& principal) const {
  auto it = balances_.find(principal);
  if (it == std::end(balances_)) {
    return 0;
  }
  return it->second;
}

const amount_t& fee_ledger::held_balance() const {
  return held_;
}

const amount_t& fee_ledger::total_deposited() const {
  return total_deposited_;
}

const amount_t& fee_ledger::total_withdrawn() const {
  return total_withdrawn_;
}

const fee_ledger::balances_t& fee_ledger::balances() const {
  return balances_;
}

void fee_ledger::restore(const amount_t& held,
                         const amount_t& total_deposited,
                         const amount_t& total_withdrawn,
                         balances_t balances) {
  held_ = held;
  total_deposited_ = total_deposited;
  total_withdrawn_ = total_withdrawn;
  balances_ = std::move(balances);
}

}  // namespace canon::ledger
