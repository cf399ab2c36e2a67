#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace veg21 {

class IIdSource {
public:
  virtual ~IIdSource() = default;

  // Unique record identifier such as "stake_1712345678901_3f9a0c1e".
  virtual std::string next_id(std::string_view prefix, Timestamp now) = 0;
  // Reference hash for a committed transaction, "0x" followed by 64 hex digits.
  virtual std::string transaction_hash(std::string_view payload) = 0;
};

class SodiumIdSource final : public IIdSource {
public:
  // Throws std::runtime_error when libsodium cannot be initialized.
  SodiumIdSource();

  std::string next_id(std::string_view prefix, Timestamp now) override;
  std::string transaction_hash(std::string_view payload) override;
};

// Deterministic ids for tests: "<prefix>_<n>" and hashes over "<payload>#<n>".
class SequentialIdSource final : public IIdSource {
public:
  std::string next_id(std::string_view prefix, Timestamp now) override;
  std::string transaction_hash(std::string_view payload) override;

private:
  std::mutex mutex_;
  std::uint64_t next_ = 1;
};

std::shared_ptr<IIdSource> make_sodium_id_source();

}  // namespace veg21
