#include "core/ledger/staking.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>
#include <ratio>
#include <string>
#include <utility>

#include "core/util/canonical.hpp"

namespace veg21::ledger {

double accrued_interest(double principal, double annual_rate, Timestamp opened, Timestamp closed) {
  using days = std::chrono::duration<double, std::ratio<86400>>;
  const double elapsed_days = std::max(0.0, std::chrono::duration_cast<days>(closed - opened).count());
  return projected_interest(principal, annual_rate, elapsed_days);
}

double projected_interest(double principal, double annual_rate, double days) {
  if (!std::isfinite(principal) || !std::isfinite(days) || principal <= 0.0 || days <= 0.0) {
    return 0.0;
  }
  return principal * annual_rate * (days / kDaysPerYear);
}

OperationResult stake_tokens(LedgerSnapshot& state, double amount, const OperationContext& ctx) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    return OperationResult::failure(ErrorKind::InvalidAmount, "Stake amount must be positive.");
  }
  if (amount > state.balance.primary) {
    return OperationResult::failure(ErrorKind::InsufficientBalance,
                                    "Insufficient balance to stake " + util::format_amount(amount) +
                                        " (available " +
                                        util::format_amount(state.balance.primary) + ").");
  }

  Stake stake;
  stake.id = ctx.ids.next_id("stake", ctx.now);
  stake.principal = amount;
  stake.opened_at = ctx.now;

  OperationResult out;
  out.transaction = make_transaction(StakeDetail{.stake_id = stake.id}, amount, ctx);
  stake.tx_hash = out.transaction->tx_hash;

  state.balance.primary -= amount;
  state.total_staked += amount;
  state.stakes.push_back(stake);
  out.stake = std::move(stake);
  out.result = Result::success("Tokens staked.", out.stake->id);
  return out;
}

OperationResult unstake_tokens(LedgerSnapshot& state, std::string_view stake_id,
                               const OperationContext& ctx) {
  const auto it = std::ranges::find_if(state.stakes, [&](const Stake& stake) {
    return stake.id == stake_id && stake.is_active();
  });
  if (it == state.stakes.end()) {
    return OperationResult::failure(ErrorKind::NotFound,
                                    "No active stake with id " + std::string{stake_id});
  }

  const double accrued =
      accrued_interest(it->principal, ctx.config.annual_staking_rate, it->opened_at, ctx.now);
  const double returned = it->principal + accrued;

  OperationResult out;
  out.transaction = make_transaction(
      UnstakeDetail{.stake_id = it->id, .principal = it->principal, .accrued = accrued}, returned,
      ctx);

  it->closed_at = ctx.now;
  it->accrued_rewards = accrued;
  state.balance.primary += returned;
  state.total_staked = std::max(0.0, state.total_staked - it->principal);
  state.total_staking_rewards += accrued;
  state.total_earned += accrued;
  out.stake = *it;
  out.result = Result::success("Tokens unstaked.", util::double_to_text(returned));
  return out;
}

std::vector<Stake> active_stakes(const LedgerSnapshot& state) {
  std::vector<Stake> out;
  std::ranges::copy_if(state.stakes, std::back_inserter(out),
                       [](const Stake& stake) { return stake.is_active(); });
  return out;
}

}  // namespace veg21::ledger
