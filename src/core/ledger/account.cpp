#include "core/ledger/account.hpp"

#include <string>

#include "core/ledger/rewards.hpp"
#include "core/util/canonical.hpp"

namespace veg21::ledger {

LedgerSnapshot make_default_snapshot() {
  LedgerSnapshot state;
  state.rewards = default_reward_catalogue();
  return state;
}

std::vector<Cause> supported_causes() {
  return {
      {
          .id = "vegan_outreach",
          .name = "Vegan Outreach",
          .description = "Education and outreach promoting plant-based living.",
      },
      {
          .id = "animal_sanctuary",
          .name = "Animal Sanctuary",
          .description = "Care for rescued farm animals.",
      },
      {
          .id = "environmental_fund",
          .name = "Environmental Fund",
          .description = "Reforestation and climate projects.",
      },
  };
}

OperationResult initialize_account(LedgerSnapshot& state, std::string_view account_id,
                                   const OperationContext& ctx) {
  OperationResult out;
  if (state.initialized) {
    out.result = Result::success("Ledger already initialized.", state.account_id);
    return out;
  }

  const std::string account = util::trim_copy(account_id);
  out.transaction = make_transaction(
      GrantDetail{.account_id = account, .secondary = ctx.config.starting_secondary},
      ctx.config.starting_primary, ctx);

  // The grant adds to both balances so receipts recorded before the first
  // initialize are kept and the log replays to the same totals.
  state.initialized = true;
  state.account_id = account;
  state.balance.primary += ctx.config.starting_primary;
  state.balance.secondary += ctx.config.starting_secondary;
  if (state.rewards.empty()) {
    state.rewards = default_reward_catalogue();
  }
  out.result = Result::success("Ledger initialized.", account);
  return out;
}

}  // namespace veg21::ledger
