#include "core/model/types.hpp"

#include <array>

namespace veg21 {
namespace {

constexpr std::array<std::string_view, 9> kTransactionKindNames = {
    "grant",    "claim_reward", "contribute",     "transfer", "receive",
    "stake_tokens", "unstake_tokens", "check_in", "validation",
};

}  // namespace

std::optional<std::string> Transaction::counterpart() const {
  if (const auto* transfer = std::get_if<TransferDetail>(&detail)) {
    return transfer->to_address;
  }
  if (const auto* receive = std::get_if<ReceiveDetail>(&detail)) {
    return receive->from_address;
  }
  return std::nullopt;
}

double Transaction::signed_amount() const {
  switch (balance_effect(kind())) {
    case BalanceEffect::Credit:
      return amount;
    case BalanceEffect::Debit:
      return -amount;
    case BalanceEffect::None:
      return 0.0;
  }
  return 0.0;
}

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::InvalidAmount:
      return "InvalidAmount";
    case ErrorKind::InsufficientBalance:
      return "InsufficientBalance";
    case ErrorKind::InvalidAddress:
      return "InvalidAddress";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::NotUnlocked:
      return "NotUnlocked";
    case ErrorKind::AlreadyClaimed:
      return "AlreadyClaimed";
    case ErrorKind::DuplicateId:
      return "DuplicateId";
    case ErrorKind::PersistenceFailure:
      return "PersistenceFailure";
    case ErrorKind::InvalidConfig:
      return "InvalidConfig";
  }
  return "None";
}

std::string_view reward_category_name(RewardCategory category) {
  switch (category) {
    case RewardCategory::Milestone:
      return "milestone";
    case RewardCategory::Daily:
      return "daily";
    case RewardCategory::Bonus:
      return "bonus";
  }
  return "milestone";
}

std::optional<RewardCategory> reward_category_from_name(std::string_view text) {
  if (text == "milestone") {
    return RewardCategory::Milestone;
  }
  if (text == "daily") {
    return RewardCategory::Daily;
  }
  if (text == "bonus") {
    return RewardCategory::Bonus;
  }
  return std::nullopt;
}

std::string_view reward_status_name(RewardStatus status) {
  switch (status) {
    case RewardStatus::Locked:
      return "locked";
    case RewardStatus::Unlocked:
      return "unlocked";
    case RewardStatus::Claimed:
      return "claimed";
  }
  return "locked";
}

std::optional<RewardStatus> reward_status_from_name(std::string_view text) {
  if (text == "locked") {
    return RewardStatus::Locked;
  }
  if (text == "unlocked") {
    return RewardStatus::Unlocked;
  }
  if (text == "claimed") {
    return RewardStatus::Claimed;
  }
  return std::nullopt;
}

std::string_view transaction_kind_name(TransactionKind kind) {
  const auto index = static_cast<std::size_t>(kind);
  if (index >= kTransactionKindNames.size()) {
    return "grant";
  }
  return kTransactionKindNames[index];
}

std::optional<TransactionKind> transaction_kind_from_name(std::string_view text) {
  for (std::size_t i = 0; i < kTransactionKindNames.size(); ++i) {
    if (kTransactionKindNames[i] == text) {
      return static_cast<TransactionKind>(i);
    }
  }
  return std::nullopt;
}

std::string_view transaction_status_name(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::Pending:
      return "pending";
    case TransactionStatus::Confirmed:
      return "confirmed";
    case TransactionStatus::Failed:
      return "failed";
  }
  return "confirmed";
}

std::optional<TransactionStatus> transaction_status_from_name(std::string_view text) {
  if (text == "pending") {
    return TransactionStatus::Pending;
  }
  if (text == "confirmed") {
    return TransactionStatus::Confirmed;
  }
  if (text == "failed") {
    return TransactionStatus::Failed;
  }
  return std::nullopt;
}

BalanceEffect balance_effect(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::Grant:
    case TransactionKind::ClaimReward:
    case TransactionKind::Receive:
    case TransactionKind::UnstakeTokens:
      return BalanceEffect::Credit;
    case TransactionKind::Contribute:
    case TransactionKind::Transfer:
    case TransactionKind::StakeTokens:
      return BalanceEffect::Debit;
    case TransactionKind::CheckIn:
    case TransactionKind::Validation:
      return BalanceEffect::None;
  }
  return BalanceEffect::None;
}

}  // namespace veg21
