#pragma once

#include <string_view>
#include <vector>

#include "core/ledger/transaction_log.hpp"
#include "core/model/types.hpp"

namespace veg21::ledger {

// Uninitialized, zero balance, default reward catalogue all locked.
LedgerSnapshot make_default_snapshot();

std::vector<Cause> supported_causes();

// Seeds the starting balance on the first call. Later calls succeed without
// producing a transaction.
OperationResult initialize_account(LedgerSnapshot& state, std::string_view account_id,
                                   const OperationContext& ctx);

}  // namespace veg21::ledger
