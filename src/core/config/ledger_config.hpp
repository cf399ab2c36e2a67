#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace veg21 {

// Applies key=value lines from `path` on top of `config`. Lines starting
// with '#' and unknown keys are skipped. On failure `config` is untouched.
Result load_ledger_config(std::string_view path, LedgerConfig& config);
Result write_ledger_config(std::string_view path, const LedgerConfig& config);
Result validate_ledger_config(const LedgerConfig& config);

}  // namespace veg21
