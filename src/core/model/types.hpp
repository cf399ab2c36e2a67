#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace veg21 {

using Timestamp = std::chrono::system_clock::time_point;

enum class ErrorKind {
  None,
  InvalidAmount,
  InsufficientBalance,
  InvalidAddress,
  NotFound,
  NotUnlocked,
  AlreadyClaimed,
  DuplicateId,
  PersistenceFailure,
  InvalidConfig,
};

struct Result {
  bool ok = false;
  ErrorKind error = ErrorKind::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorKind::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorKind error, std::string msg) {
    return {false, error, std::move(msg), {}};
  }
};

struct Balance {
  double primary = 0.0;
  double secondary = 0.0;

  bool operator==(const Balance&) const = default;
};

enum class RewardCategory {
  Milestone,
  Daily,
  Bonus,
};

enum class RewardStatus {
  Locked,
  Unlocked,
  Claimed,
};

struct Reward {
  std::string id;
  RewardCategory category = RewardCategory::Milestone;
  double amount = 0.0;
  std::string description;
  RewardStatus status = RewardStatus::Locked;
  std::optional<Timestamp> unlocked_at;
  std::optional<Timestamp> claimed_at;
  std::optional<int> milestone_day;

  [[nodiscard]] bool unlocked() const { return status != RewardStatus::Locked; }
  [[nodiscard]] bool claimed() const { return status == RewardStatus::Claimed; }
};

struct Cause {
  std::string id;
  std::string name;
  std::string description;
};

struct Contribution {
  std::string id;
  std::string cause_id;
  double amount = 0.0;
  Timestamp timestamp{};
  std::string tx_hash;
};

struct Stake {
  std::string id;
  double principal = 0.0;
  Timestamp opened_at{};
  std::optional<Timestamp> closed_at;
  double accrued_rewards = 0.0;
  std::string tx_hash;

  [[nodiscard]] bool is_active() const { return !closed_at.has_value(); }
};

enum class TransactionKind {
  Grant,
  ClaimReward,
  Contribute,
  Transfer,
  Receive,
  StakeTokens,
  UnstakeTokens,
  CheckIn,
  Validation,
};

enum class TransactionStatus {
  Pending,
  Confirmed,
  Failed,
};

enum class BalanceEffect {
  Credit,
  Debit,
  None,
};

struct GrantDetail {
  std::string account_id;
  double secondary = 0.0;
};

struct ClaimDetail {
  std::string reward_id;
};

struct ContributeDetail {
  std::string cause_id;
  std::string contribution_id;
};

struct TransferDetail {
  std::string to_address;
  std::string note;
};

struct ReceiveDetail {
  std::string from_address;
  std::string note;
};

struct StakeDetail {
  std::string stake_id;
};

struct UnstakeDetail {
  std::string stake_id;
  double principal = 0.0;
  double accrued = 0.0;
};

struct CheckInDetail {
  std::string description;
};

struct ValidationDetail {
  std::string description;
};

// Alternative order matches TransactionKind.
using TransactionDetail =
    std::variant<GrantDetail, ClaimDetail, ContributeDetail, TransferDetail, ReceiveDetail,
                 StakeDetail, UnstakeDetail, CheckInDetail, ValidationDetail>;

struct Transaction {
  std::string id;
  TransactionDetail detail;
  double amount = 0.0;
  TransactionStatus status = TransactionStatus::Confirmed;
  Timestamp timestamp{};
  std::string tx_hash;
  std::vector<std::pair<std::string, std::string>> metadata;

  [[nodiscard]] TransactionKind kind() const {
    return static_cast<TransactionKind>(detail.index());
  }
  [[nodiscard]] std::optional<std::string> counterpart() const;
  [[nodiscard]] double signed_amount() const;
};

struct LedgerSnapshot {
  bool initialized = false;
  std::string account_id;
  Balance balance;
  std::vector<Reward> rewards;
  std::vector<Stake> stakes;
  std::vector<Contribution> contributions;
  double total_earned = 0.0;
  double total_contributed = 0.0;
  double total_staked = 0.0;
  double total_staking_rewards = 0.0;
};

// Result of a committed (or rejected) ledger operation. Record fields are set
// only for the records the operation produced.
struct OperationResult {
  Result result;
  std::optional<Transaction> transaction;
  std::optional<Reward> reward;
  std::optional<Contribution> contribution;
  std::optional<Stake> stake;

  [[nodiscard]] bool ok() const { return result.ok; }
  [[nodiscard]] ErrorKind error() const { return result.error; }

  static OperationResult failure(ErrorKind error, std::string msg) {
    OperationResult out;
    out.result = Result::failure(error, std::move(msg));
    return out;
  }
};

struct LedgerConfig {
  std::string data_dir = "veg21-ledger-data";
  double starting_primary = 100.0;
  double starting_secondary = 0.5;
  double annual_staking_rate = 0.05;
  std::size_t min_address_length = 10;
  std::chrono::milliseconds initialize_delay{1000};
  std::chrono::milliseconds claim_delay{2000};
  std::chrono::milliseconds operation_delay{2000};
  std::string log_level = "info";
  std::string log_file;
};

std::string_view error_kind_name(ErrorKind kind);
std::string_view reward_category_name(RewardCategory category);
std::optional<RewardCategory> reward_category_from_name(std::string_view text);
std::string_view reward_status_name(RewardStatus status);
std::optional<RewardStatus> reward_status_from_name(std::string_view text);
std::string_view transaction_kind_name(TransactionKind kind);
std::optional<TransactionKind> transaction_kind_from_name(std::string_view text);
std::string_view transaction_status_name(TransactionStatus status);
std::optional<TransactionStatus> transaction_status_from_name(std::string_view text);
BalanceEffect balance_effect(TransactionKind kind);

}  // namespace veg21
