#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/ledger_service.hpp"

namespace veg21 {

// Blocking front end over LedgerService for shells that do not want
// futures. Every call before a successful init() fails or returns empty.
class CoreApi {
public:
  Result init(const LedgerConfig& config, std::optional<LedgerDependencies> deps = std::nullopt);
  [[nodiscard]] bool ready() const { return service_ != nullptr; }

  OperationResult initialize(std::string_view account_id);
  OperationResult claim_reward(std::string_view reward_id);
  OperationResult contribute(std::string_view cause_id, double amount);
  OperationResult transfer_tokens(std::string_view to_address, double amount, std::string_view note);
  OperationResult record_receive(std::string_view from_address, double amount, std::string_view note);
  OperationResult stake_tokens(double amount);
  OperationResult unstake_tokens(std::string_view stake_id);
  OperationResult record_activity(TransactionKind kind, std::string_view description);

  bool unlock_reward(std::string_view reward_id);
  std::vector<std::string> record_progress(int day);
  Result add_reward(Reward reward);
  Result reset();

  [[nodiscard]] LedgerSnapshot state() const;
  [[nodiscard]] std::vector<Reward> all_rewards() const;
  [[nodiscard]] std::vector<Reward> claimable_rewards() const;
  [[nodiscard]] std::vector<Stake> all_stakes() const;
  [[nodiscard]] std::vector<Transaction> transactions() const;
  [[nodiscard]] std::vector<Cause> supported_causes() const;
  [[nodiscard]] double cause_total(std::string_view cause_id) const;
  [[nodiscard]] Balance audit_balance() const;
  [[nodiscard]] bool is_consistent() const;
  [[nodiscard]] double projected_staking_reward(double amount, double days) const;
  [[nodiscard]] double staking_apy_percent() const;

private:
  std::unique_ptr<LedgerService> service_;
};

}  // namespace veg21
