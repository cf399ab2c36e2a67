#include "core/crypto/id_source.hpp"

#include <stdexcept>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace veg21 {
namespace {

constexpr std::size_t kIdRandomBytes = 4;

std::int64_t unix_millis(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

}  // namespace

SodiumIdSource::SodiumIdSource() {
  const Result ready = util::init_sodium();
  if (!ready.ok) {
    throw std::runtime_error(ready.message);
  }
}

std::string SodiumIdSource::next_id(std::string_view prefix, Timestamp now) {
  return std::string{prefix} + "_" + std::to_string(unix_millis(now)) + "_" +
         util::random_hex(kIdRandomBytes);
}

std::string SodiumIdSource::transaction_hash(std::string_view payload) {
  return "0x" + util::sha256_hex(std::string{payload} + "|" + util::random_hex(kIdRandomBytes));
}

std::string SequentialIdSource::next_id(std::string_view prefix, Timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::string{prefix} + "_" + std::to_string(next_++);
}

std::string SequentialIdSource::transaction_hash(std::string_view payload) {
  std::uint64_t n = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    n = next_++;
  }
  return "0x" + util::sha256_hex(std::string{payload} + "#" + std::to_string(n));
}

std::shared_ptr<IIdSource> make_sodium_id_source() {
  return std::make_shared<SodiumIdSource>();
}

}  // namespace veg21
