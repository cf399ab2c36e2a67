#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace veg21::util {

// Safe to call repeatedly; libsodium tracks its own initialization.
Result init_sodium();

std::string sha256_hex(std::string_view payload);
std::string random_hex(std::size_t bytes);

}  // namespace veg21::util
