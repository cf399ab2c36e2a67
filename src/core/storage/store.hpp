#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/kv_backend.hpp"

namespace veg21 {

// Serializes the ledger snapshot and the transaction log as two independent
// blobs. Loads never fail: a missing or unreadable blob yields the default.
class Store {
public:
  explicit Store(std::shared_ptr<IKeyValueBackend> backend);

  [[nodiscard]] LedgerSnapshot load() const;
  [[nodiscard]] std::vector<Transaction> load_log() const;

  Result save(const LedgerSnapshot& state);
  Result save_log(const std::vector<Transaction>& transactions);
  Result reset();

  static std::string encode_snapshot(const LedgerSnapshot& state);
  static std::optional<LedgerSnapshot> decode_snapshot(std::string_view blob);
  static std::string encode_log(const std::vector<Transaction>& transactions);
  static std::optional<std::vector<Transaction>> decode_log(std::string_view blob);

private:
  std::shared_ptr<IKeyValueBackend> backend_;
};

}  // namespace veg21
