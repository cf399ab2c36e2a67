#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/crypto/id_source.hpp"
#include "core/model/types.hpp"

namespace veg21::ledger {

// Everything an operation needs besides the state it mutates.
struct OperationContext {
  Timestamp now;
  IIdSource& ids;
  const LedgerConfig& config;
};

// Builds a confirmed transaction with a fresh id and reference hash.
Transaction make_transaction(TransactionDetail detail, double amount, const OperationContext& ctx,
                             std::vector<std::pair<std::string, std::string>> metadata = {});

class TransactionLog {
public:
  TransactionLog() = default;
  explicit TransactionLog(std::vector<Transaction> entries);

  void append(Transaction tx);
  void clear();

  [[nodiscard]] const std::vector<Transaction>& entries() const { return entries_; }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] Balance replay_balance() const;

  // Rebuilds both balances from the signed amounts and grants in log order.
  static Balance replay(const std::vector<Transaction>& entries);

private:
  std::vector<Transaction> entries_;
};

}  // namespace veg21::ledger
