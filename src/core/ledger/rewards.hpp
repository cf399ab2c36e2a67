#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/ledger/transaction_log.hpp"
#include "core/model/types.hpp"

namespace veg21::ledger {

std::vector<Reward> default_reward_catalogue();

// Locked to unlocked. False when the id is unknown or already unlocked.
bool unlock_reward(LedgerSnapshot& state, std::string_view reward_id, Timestamp now);

// Unlocks every locked reward whose milestone day is at most `day` and
// returns the ids that changed.
std::vector<std::string> record_progress(LedgerSnapshot& state, int day, Timestamp now);

Result add_reward(LedgerSnapshot& state, Reward reward);

OperationResult claim_reward(LedgerSnapshot& state, std::string_view reward_id,
                             const OperationContext& ctx);

[[nodiscard]] bool has_milestone_completed(const LedgerSnapshot& state, std::string_view reward_id);
[[nodiscard]] std::vector<Reward> claimable_rewards(const LedgerSnapshot& state);

}  // namespace veg21::ledger
