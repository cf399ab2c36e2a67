#pragma once

#include <string_view>
#include <vector>

#include "core/ledger/transaction_log.hpp"
#include "core/model/types.hpp"

namespace veg21::ledger {

inline constexpr double kDaysPerYear = 365.0;

// Simple prorated interest, principal * rate * days / 365. Negative elapsed
// time counts as zero.
[[nodiscard]] double accrued_interest(double principal, double annual_rate, Timestamp opened,
                                      Timestamp closed);
[[nodiscard]] double projected_interest(double principal, double annual_rate, double days);

OperationResult stake_tokens(LedgerSnapshot& state, double amount, const OperationContext& ctx);
OperationResult unstake_tokens(LedgerSnapshot& state, std::string_view stake_id,
                               const OperationContext& ctx);

[[nodiscard]] std::vector<Stake> active_stakes(const LedgerSnapshot& state);

}  // namespace veg21::ledger
