#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace veg21::util {

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string to_hex(std::string_view bytes);
// Returns nullopt on odd length or a non-hex digit.
std::optional<std::string> from_hex(std::string_view hex);

std::int64_t to_unix_nanos(Timestamp ts);
Timestamp from_unix_nanos(std::int64_t nanos);

// Shortest text that parses back to the same double.
std::string double_to_text(double value);
std::optional<double> parse_double(std::string_view text);
std::optional<std::int64_t> parse_int64(std::string_view text);

std::string format_amount(double value, int decimals = 2);

std::vector<std::string_view> split_fields(std::string_view line, char separator = '\t');

}  // namespace veg21::util
