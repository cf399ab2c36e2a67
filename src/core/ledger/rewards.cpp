#include "core/ledger/rewards.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>
#include <string>
#include <utility>

#include "core/util/canonical.hpp"

namespace veg21::ledger {
namespace {

Reward* find_reward(LedgerSnapshot& state, std::string_view reward_id) {
  const auto it = std::ranges::find(state.rewards, reward_id, &Reward::id);
  return it == state.rewards.end() ? nullptr : &*it;
}

Reward milestone(std::string id, double amount, std::string description, int day) {
  Reward reward;
  reward.id = std::move(id);
  reward.category = RewardCategory::Milestone;
  reward.amount = amount;
  reward.description = std::move(description);
  reward.milestone_day = day;
  return reward;
}

}  // namespace

std::vector<Reward> default_reward_catalogue() {
  std::vector<Reward> catalogue;
  catalogue.push_back(milestone("day_1_bonus", 50.0, "Started the 21-day vegan challenge", 1));
  catalogue.push_back(milestone("week_1_milestone", 100.0, "Completed 7 vegan days", 7));
  catalogue.push_back(milestone("week_2_milestone", 150.0, "Two weeks of vegan commitment", 14));
  catalogue.push_back(milestone("challenge_complete", 300.0, "Completed the 21-day challenge", 21));

  Reward champion;
  champion.id = "community_champion";
  champion.category = RewardCategory::Bonus;
  champion.amount = 25.0;
  champion.description = "Contributed to the vegan community";
  catalogue.push_back(std::move(champion));
  return catalogue;
}

bool unlock_reward(LedgerSnapshot& state, std::string_view reward_id, Timestamp now) {
  Reward* reward = find_reward(state, reward_id);
  if (reward == nullptr || reward->status != RewardStatus::Locked) {
    return false;
  }
  reward->status = RewardStatus::Unlocked;
  reward->unlocked_at = now;
  return true;
}

std::vector<std::string> record_progress(LedgerSnapshot& state, int day, Timestamp now) {
  std::vector<std::string> unlocked;
  for (auto& reward : state.rewards) {
    if (reward.status != RewardStatus::Locked || !reward.milestone_day.has_value()) {
      continue;
    }
    if (*reward.milestone_day <= day) {
      reward.status = RewardStatus::Unlocked;
      reward.unlocked_at = now;
      unlocked.push_back(reward.id);
    }
  }
  return unlocked;
}

Result add_reward(LedgerSnapshot& state, Reward reward) {
  reward.id = util::trim_copy(reward.id);
  if (reward.id.empty()) {
    return Result::failure(ErrorKind::InvalidConfig, "Reward requires an id.");
  }
  if (!std::isfinite(reward.amount) || reward.amount <= 0.0) {
    return Result::failure(ErrorKind::InvalidAmount, "Reward amount must be positive.");
  }
  if (find_reward(state, reward.id) != nullptr) {
    return Result::failure(ErrorKind::DuplicateId, "Reward already exists: " + reward.id);
  }

  reward.status = RewardStatus::Locked;
  reward.unlocked_at.reset();
  reward.claimed_at.reset();
  const std::string id = reward.id;
  state.rewards.push_back(std::move(reward));
  return Result::success("Reward added.", id);
}

OperationResult claim_reward(LedgerSnapshot& state, std::string_view reward_id,
                             const OperationContext& ctx) {
  Reward* reward = find_reward(state, reward_id);
  if (reward == nullptr) {
    return OperationResult::failure(ErrorKind::NotFound,
                                    "Reward not found: " + std::string{reward_id});
  }
  if (reward->status == RewardStatus::Locked) {
    return OperationResult::failure(ErrorKind::NotUnlocked,
                                    "Reward is not unlocked yet: " + reward->id);
  }
  if (reward->status == RewardStatus::Claimed) {
    return OperationResult::failure(ErrorKind::AlreadyClaimed,
                                    "Reward already claimed: " + reward->id);
  }

  OperationResult out;
  out.transaction = make_transaction(ClaimDetail{.reward_id = reward->id}, reward->amount, ctx,
                                     {{"description", reward->description}});

  reward->status = RewardStatus::Claimed;
  reward->claimed_at = ctx.now;
  state.balance.primary += reward->amount;
  state.total_earned += reward->amount;
  out.reward = *reward;
  out.result = Result::success("Reward claimed.", out.transaction->tx_hash);
  return out;
}

bool has_milestone_completed(const LedgerSnapshot& state, std::string_view reward_id) {
  const auto it = std::ranges::find(state.rewards, reward_id, &Reward::id);
  return it != state.rewards.end() && it->unlocked();
}

std::vector<Reward> claimable_rewards(const LedgerSnapshot& state) {
  std::vector<Reward> out;
  for (const auto& reward : state.rewards) {
    if (reward.status == RewardStatus::Unlocked) {
      out.push_back(reward);
    }
  }
  return out;
}

}  // namespace veg21::ledger
