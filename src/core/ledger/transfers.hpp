#pragma once

#include <string_view>
#include <vector>

#include "core/ledger/transaction_log.hpp"
#include "core/model/types.hpp"

namespace veg21::ledger {

OperationResult contribute(LedgerSnapshot& state, std::string_view cause_id, double amount,
                           const OperationContext& ctx);

// Validation order: address, amount, balance.
OperationResult transfer_tokens(LedgerSnapshot& state, std::string_view to_address, double amount,
                                std::string_view note, const OperationContext& ctx);

// Zero is accepted and recorded.
OperationResult record_receive(LedgerSnapshot& state, std::string_view from_address, double amount,
                               std::string_view note, const OperationContext& ctx);

// kind must be CheckIn or Validation; anything else is rejected as NotFound.
OperationResult record_activity(TransactionKind kind, std::string_view description,
                                const OperationContext& ctx);

[[nodiscard]] std::vector<Contribution> contributions_by_cause(const LedgerSnapshot& state,
                                                               std::string_view cause_id);
[[nodiscard]] double cause_total(const LedgerSnapshot& state, std::string_view cause_id);

}  // namespace veg21::ledger
