#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/ledger_config.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitDomainError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
  out << veg21::kAppDisplayName << ' ' << veg21::kAppVersion << " (" << veg21::kBuildRelease
      << ")\n"
      << "usage: veg21_ledger [--data-dir DIR] [--config FILE] [--log-level LEVEL] <command> [args]\n\n"
      << "commands:\n"
      << "  init [ACCOUNT]                 seed the starting balance\n"
      << "  status                         balance and running totals\n"
      << "  rewards                        reward catalogue\n"
      << "  unlock REWARD                  unlock a reward\n"
      << "  progress DAY                   unlock milestones up to a challenge day\n"
      << "  claim REWARD                   claim an unlocked reward\n"
      << "  contribute CAUSE AMOUNT        donate to a cause\n"
      << "  send ADDRESS AMOUNT [NOTE]     transfer tokens\n"
      << "  receive ADDRESS AMOUNT [NOTE]  record an incoming transfer\n"
      << "  stake AMOUNT                   open a stake\n"
      << "  unstake STAKE                  close a stake with interest\n"
      << "  stakes                         list stakes\n"
      << "  history                        transaction log\n"
      << "  causes                         supported causes and totals\n"
      << "  audit                          replay the log against the balance\n"
      << "  reset                          clear all ledger data\n";
}

std::string amount_text(double value) {
  return veg21::util::format_amount(value) + " " + std::string{veg21::kTokenSymbol};
}

std::string gas_text(double value) {
  return veg21::util::format_amount(value, 4) + " " + std::string{veg21::kGasSymbol};
}

int report(const veg21::OperationResult& result) {
  if (!result.ok()) {
    std::cerr << "error [" << veg21::error_kind_name(result.error()) << "]: "
              << result.result.message << '\n';
    return kExitDomainError;
  }
  std::cout << result.result.message << '\n';
  if (result.transaction.has_value()) {
    std::cout << "  tx " << result.transaction->id << ' '
              << veg21::transaction_kind_name(result.transaction->kind()) << ' '
              << amount_text(result.transaction->amount) << '\n'
              << "  hash " << result.transaction->tx_hash << '\n';
  }
  return kExitOk;
}

std::optional<double> parse_amount_arg(std::string_view text) {
  return veg21::util::parse_double(veg21::util::trim_copy(text));
}

void print_status(const veg21::CoreApi& api) {
  const veg21::LedgerSnapshot state = api.state();
  std::cout << "account: " << (state.initialized ? state.account_id : "(not initialized)") << '\n'
            << "balance: " << amount_text(state.balance.primary) << ", "
            << gas_text(state.balance.secondary) << '\n'
            << "earned: " << amount_text(state.total_earned) << '\n'
            << "contributed: " << amount_text(state.total_contributed) << '\n'
            << "staked: " << amount_text(state.total_staked) << " at "
            << veg21::util::format_amount(api.staking_apy_percent()) << "% APY\n"
            << "staking rewards: " << amount_text(state.total_staking_rewards) << '\n';
}

void print_rewards(const veg21::CoreApi& api) {
  for (const auto& reward : api.all_rewards()) {
    std::cout << reward.id << '\t' << veg21::reward_category_name(reward.category) << '\t'
              << amount_text(reward.amount) << '\t' << veg21::reward_status_name(reward.status);
    if (reward.milestone_day.has_value()) {
      std::cout << "\tday " << *reward.milestone_day;
    }
    std::cout << '\t' << reward.description << '\n';
  }
}

void print_stakes(const veg21::CoreApi& api) {
  const auto stakes = api.all_stakes();
  if (stakes.empty()) {
    std::cout << "No stakes.\n";
    return;
  }
  for (const auto& stake : stakes) {
    std::cout << stake.id << '\t' << amount_text(stake.principal) << '\t'
              << (stake.is_active() ? "active" : "closed");
    if (!stake.is_active()) {
      std::cout << "\taccrued " << amount_text(stake.accrued_rewards);
    }
    std::cout << '\n';
  }
}

void print_history(const veg21::CoreApi& api) {
  const auto transactions = api.transactions();
  if (transactions.empty()) {
    std::cout << "No transactions.\n";
    return;
  }
  for (const auto& tx : transactions) {
    std::cout << tx.id << '\t' << veg21::transaction_kind_name(tx.kind()) << '\t'
              << veg21::util::format_amount(tx.signed_amount()) << '\t'
              << veg21::transaction_status_name(tx.status);
    if (const auto counterpart = tx.counterpart(); counterpart.has_value()) {
      std::cout << '\t' << *counterpart;
    }
    std::cout << '\n';
  }
}

void print_causes(const veg21::CoreApi& api) {
  for (const auto& cause : api.supported_causes()) {
    std::cout << cause.id << '\t' << cause.name << '\t' << amount_text(api.cause_total(cause.id))
              << '\t' << cause.description << '\n';
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  veg21::LedgerConfig config;
  std::optional<std::string> data_dir_override;
  std::optional<std::string> log_level_override;
  std::optional<std::string> config_path;

  std::size_t index = 0;
  while (index < args.size() && args[index].starts_with("--")) {
    const std::string& flag = args[index];
    if (flag == "--help") {
      print_usage(std::cout);
      return kExitOk;
    }
    if (index + 1 >= args.size()) {
      std::cerr << "Missing value for " << flag << '\n';
      return kExitUsage;
    }
    if (flag == "--data-dir") {
      data_dir_override = args[index + 1];
    } else if (flag == "--config") {
      config_path = args[index + 1];
    } else if (flag == "--log-level") {
      log_level_override = args[index + 1];
    } else {
      std::cerr << "Unknown option " << flag << '\n';
      print_usage(std::cerr);
      return kExitUsage;
    }
    index += 2;
  }

  if (index >= args.size()) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  if (config_path.has_value()) {
    if (const veg21::Result loaded = veg21::load_ledger_config(*config_path, config); !loaded.ok) {
      std::cerr << "Config error: " << loaded.message << '\n';
      return kExitUsage;
    }
  }
  if (data_dir_override.has_value()) {
    config.data_dir = *data_dir_override;
  }
  if (log_level_override.has_value()) {
    config.log_level = *log_level_override;
  }

  const auto severity = veg21::log::severity_from_string(config.log_level);
  if (!severity.has_value()) {
    std::cerr << "Unknown log level: " << config.log_level << '\n';
    return kExitUsage;
  }
  veg21::log::init(*severity, config.log_file);

  veg21::CoreApi api;
  if (const veg21::Result init = api.init(config); !init.ok) {
    std::cerr << "veg21 ledger init failed: " << init.message << '\n';
    return kExitDomainError;
  }

  const std::string command = args[index];
  const std::vector<std::string> params(args.begin() + static_cast<std::ptrdiff_t>(index) + 1,
                                        args.end());
  const auto need = [&](std::size_t count) {
    if (params.size() < count) {
      std::cerr << "'" << command << "' needs " << count << " argument(s).\n";
      return false;
    }
    return true;
  };

  if (command == "init") {
    return report(api.initialize(params.empty() ? "local-account" : params[0]));
  }
  if (command == "status") {
    print_status(api);
    return kExitOk;
  }
  if (command == "rewards") {
    print_rewards(api);
    return kExitOk;
  }
  if (command == "unlock") {
    if (!need(1)) {
      return kExitUsage;
    }
    if (!api.unlock_reward(params[0])) {
      std::cerr << "Reward " << params[0] << " is unknown or already unlocked.\n";
      return kExitDomainError;
    }
    std::cout << "Reward " << params[0] << " unlocked.\n";
    return kExitOk;
  }
  if (command == "progress") {
    if (!need(1)) {
      return kExitUsage;
    }
    const auto day = veg21::util::parse_int64(params[0]);
    if (!day.has_value()) {
      std::cerr << "Invalid day: " << params[0] << '\n';
      return kExitUsage;
    }
    const auto unlocked = api.record_progress(static_cast<int>(*day));
    std::cout << "Unlocked " << unlocked.size() << " reward(s).\n";
    for (const auto& id : unlocked) {
      std::cout << "  " << id << '\n';
    }
    return kExitOk;
  }
  if (command == "claim") {
    if (!need(1)) {
      return kExitUsage;
    }
    return report(api.claim_reward(params[0]));
  }
  if (command == "contribute" || command == "send" || command == "receive") {
    if (!need(2)) {
      return kExitUsage;
    }
    const auto amount = parse_amount_arg(params[1]);
    if (!amount.has_value()) {
      std::cerr << "Invalid amount: " << params[1] << '\n';
      return kExitUsage;
    }
    const std::string note = params.size() > 2 ? params[2] : std::string{};
    if (command == "contribute") {
      return report(api.contribute(params[0], *amount));
    }
    if (command == "send") {
      return report(api.transfer_tokens(params[0], *amount, note));
    }
    return report(api.record_receive(params[0], *amount, note));
  }
  if (command == "stake") {
    if (!need(1)) {
      return kExitUsage;
    }
    const auto amount = parse_amount_arg(params[0]);
    if (!amount.has_value()) {
      std::cerr << "Invalid amount: " << params[0] << '\n';
      return kExitUsage;
    }
    return report(api.stake_tokens(*amount));
  }
  if (command == "unstake") {
    if (!need(1)) {
      return kExitUsage;
    }
    return report(api.unstake_tokens(params[0]));
  }
  if (command == "stakes") {
    print_stakes(api);
    return kExitOk;
  }
  if (command == "history") {
    print_history(api);
    return kExitOk;
  }
  if (command == "causes") {
    print_causes(api);
    return kExitOk;
  }
  if (command == "audit") {
    const bool consistent = api.is_consistent();
    const veg21::Balance replayed = api.audit_balance();
    const veg21::Balance stored = api.state().balance;
    std::cout << "replayed balance: " << amount_text(replayed.primary) << " / "
              << gas_text(replayed.secondary) << '\n'
              << "stored balance:   " << amount_text(stored.primary) << " / "
              << gas_text(stored.secondary) << '\n'
              << (consistent ? "consistent" : "MISMATCH") << '\n';
    return consistent ? kExitOk : kExitDomainError;
  }
  if (command == "reset") {
    const veg21::Result reset = api.reset();
    std::cout << reset.message << '\n';
    return reset.ok ? kExitOk : kExitDomainError;
  }

  std::cerr << "Unknown command: " << command << '\n';
  print_usage(std::cerr);
  return kExitUsage;
}
