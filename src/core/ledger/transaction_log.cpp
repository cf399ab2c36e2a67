#include "core/ledger/transaction_log.hpp"

#include <variant>

#include "core/util/canonical.hpp"

namespace veg21::ledger {

Transaction make_transaction(TransactionDetail detail, double amount, const OperationContext& ctx,
                             std::vector<std::pair<std::string, std::string>> metadata) {
  Transaction tx;
  tx.id = ctx.ids.next_id("tx", ctx.now);
  tx.detail = std::move(detail);
  tx.amount = amount;
  tx.status = TransactionStatus::Confirmed;
  tx.timestamp = ctx.now;
  tx.metadata = std::move(metadata);

  const std::string payload = util::canonical_join({
      {"id", tx.id},
      {"kind", std::string{transaction_kind_name(tx.kind())}},
      {"amount", util::double_to_text(amount)},
      {"unix_ns", std::to_string(util::to_unix_nanos(ctx.now))},
  });
  tx.tx_hash = ctx.ids.transaction_hash(payload);
  return tx;
}

TransactionLog::TransactionLog(std::vector<Transaction> entries) : entries_(std::move(entries)) {}

void TransactionLog::append(Transaction tx) {
  entries_.push_back(std::move(tx));
}

void TransactionLog::clear() {
  entries_.clear();
}

Balance TransactionLog::replay_balance() const {
  return replay(entries_);
}

Balance TransactionLog::replay(const std::vector<Transaction>& entries) {
  // Same operation order as the live commits so the sums are bit-identical.
  Balance balance;
  for (const auto& tx : entries) {
    switch (balance_effect(tx.kind())) {
      case BalanceEffect::Credit:
        balance.primary += tx.amount;
        break;
      case BalanceEffect::Debit:
        balance.primary -= tx.amount;
        break;
      case BalanceEffect::None:
        break;
    }
    if (const auto* grant = std::get_if<GrantDetail>(&tx.detail)) {
      balance.secondary += grant->secondary;
    }
  }
  return balance;
}

}  // namespace veg21::ledger
