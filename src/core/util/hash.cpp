#include "core/util/hash.hpp"

#include <sodium.h>

#include <array>
#include <vector>

#include "core/util/canonical.hpp"

namespace veg21::util {

Result init_sodium() {
  if (sodium_init() < 0) {
    return Result::failure(ErrorKind::InvalidConfig, "libsodium initialization failed.");
  }
  return Result::success("libsodium ready.");
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

std::string random_hex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  randombytes_buf(buffer.data(), buffer.size());
  return to_hex(std::string_view{reinterpret_cast<const char*>(buffer.data()), buffer.size()});
}

}  // namespace veg21::util
