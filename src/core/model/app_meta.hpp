#pragma once

#include <string_view>

#ifndef VEG21_APP_VERSION
#define VEG21_APP_VERSION "0.3.0"
#endif

#ifndef VEG21_BUILD_RELEASE
#define VEG21_BUILD_RELEASE "Simulated Ledger"
#endif

namespace veg21 {

inline constexpr std::string_view kAppDisplayName = "VEG21 Ledger";
inline constexpr std::string_view kTokenSymbol = "VEG21";
inline constexpr std::string_view kGasSymbol = "ASTR";
inline constexpr std::string_view kStateKey = "veg21_ledger_state";
inline constexpr std::string_view kTransactionsKey = "veg21_ledger_transactions";
inline constexpr std::string_view kAppVersion = VEG21_APP_VERSION;
inline constexpr std::string_view kBuildRelease = VEG21_BUILD_RELEASE;

}  // namespace veg21
