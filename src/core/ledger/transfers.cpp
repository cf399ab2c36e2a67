#include "core/ledger/transfers.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "core/util/canonical.hpp"

namespace veg21::ledger {
namespace {

bool valid_amount(double amount) {
  return std::isfinite(amount) && amount > 0.0;
}

Result check_debit(const LedgerSnapshot& state, double amount, std::string_view operation) {
  if (!valid_amount(amount)) {
    return Result::failure(ErrorKind::InvalidAmount,
                           std::string{operation} + " amount must be positive.");
  }
  if (amount > state.balance.primary) {
    return Result::failure(ErrorKind::InsufficientBalance,
                           "Insufficient balance for " + std::string{operation} + ": need " +
                               util::format_amount(amount) + ", have " +
                               util::format_amount(state.balance.primary) + ".");
  }
  return Result::success();
}

}  // namespace

OperationResult contribute(LedgerSnapshot& state, std::string_view cause_id, double amount,
                           const OperationContext& ctx) {
  if (const Result checked = check_debit(state, amount, "Contribution"); !checked.ok) {
    OperationResult out;
    out.result = checked;
    return out;
  }

  Contribution contribution;
  contribution.id = ctx.ids.next_id("contribution", ctx.now);
  contribution.cause_id = util::trim_copy(cause_id);
  contribution.amount = amount;
  contribution.timestamp = ctx.now;

  OperationResult out;
  out.transaction = make_transaction(
      ContributeDetail{.cause_id = contribution.cause_id, .contribution_id = contribution.id},
      amount, ctx);
  contribution.tx_hash = out.transaction->tx_hash;

  state.balance.primary -= amount;
  state.total_contributed += amount;
  state.contributions.push_back(contribution);
  out.contribution = std::move(contribution);
  out.result = Result::success("Contribution recorded.", out.transaction->tx_hash);
  return out;
}

OperationResult transfer_tokens(LedgerSnapshot& state, std::string_view to_address, double amount,
                                std::string_view note, const OperationContext& ctx) {
  const std::string address = util::trim_copy(to_address);
  if (address.size() < ctx.config.min_address_length) {
    return OperationResult::failure(ErrorKind::InvalidAddress,
                                    "Invalid destination address: " + address);
  }
  if (const Result checked = check_debit(state, amount, "Transfer"); !checked.ok) {
    OperationResult out;
    out.result = checked;
    return out;
  }

  OperationResult out;
  out.transaction = make_transaction(
      TransferDetail{.to_address = address, .note = std::string{note}}, amount, ctx);
  state.balance.primary -= amount;
  out.result = Result::success("Transfer sent.", out.transaction->tx_hash);
  return out;
}

OperationResult record_receive(LedgerSnapshot& state, std::string_view from_address, double amount,
                               std::string_view note, const OperationContext& ctx) {
  if (!std::isfinite(amount) || amount < 0.0) {
    return OperationResult::failure(ErrorKind::InvalidAmount,
                                    "Received amount must be a non-negative number.");
  }

  OperationResult out;
  out.transaction = make_transaction(
      ReceiveDetail{.from_address = util::trim_copy(from_address), .note = std::string{note}},
      amount, ctx);
  state.balance.primary += amount;
  state.total_earned += amount;
  out.result = Result::success("Receipt recorded.", out.transaction->tx_hash);
  return out;
}

OperationResult record_activity(TransactionKind kind, std::string_view description,
                                const OperationContext& ctx) {
  OperationResult out;
  if (kind == TransactionKind::CheckIn) {
    out.transaction =
        make_transaction(CheckInDetail{.description = std::string{description}}, 0.0, ctx);
  } else if (kind == TransactionKind::Validation) {
    out.transaction =
        make_transaction(ValidationDetail{.description = std::string{description}}, 0.0, ctx);
  } else {
    return OperationResult::failure(
        ErrorKind::NotFound,
        "Not an activity kind: " + std::string{transaction_kind_name(kind)});
  }
  out.result = Result::success("Activity recorded.", out.transaction->tx_hash);
  return out;
}

std::vector<Contribution> contributions_by_cause(const LedgerSnapshot& state,
                                                 std::string_view cause_id) {
  std::vector<Contribution> out;
  for (const auto& contribution : state.contributions) {
    if (contribution.cause_id == cause_id) {
      out.push_back(contribution);
    }
  }
  return out;
}

double cause_total(const LedgerSnapshot& state, std::string_view cause_id) {
  double total = 0.0;
  for (const auto& contribution : state.contributions) {
    if (contribution.cause_id == cause_id) {
      total += contribution.amount;
    }
  }
  return total;
}

}  // namespace veg21::ledger
