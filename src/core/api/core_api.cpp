#include "core/api/core_api.hpp"

#include <exception>
#include <utility>

#include "core/config/ledger_config.hpp"
#include "core/ledger/account.hpp"
#include "core/util/log.hpp"

namespace veg21 {
namespace {

OperationResult not_ready() {
  return OperationResult::failure(ErrorKind::InvalidConfig, "Ledger is not initialized.");
}

}  // namespace

Result CoreApi::init(const LedgerConfig& config, std::optional<LedgerDependencies> deps) {
  if (const Result valid = validate_ledger_config(config); !valid.ok) {
    return valid;
  }
  try {
    service_ = std::make_unique<LedgerService>(
        config, deps.has_value() ? std::move(*deps) : make_default_dependencies(config));
  } catch (const std::exception& ex) {
    LOG_ERR << "Ledger service could not start: " << ex.what();
    return Result::failure(ErrorKind::InvalidConfig, ex.what());
  }
  return Result::success("Ledger ready.", config.data_dir);
}

OperationResult CoreApi::initialize(std::string_view account_id) {
  if (!service_) {
    return not_ready();
  }
  return service_->initialize(std::string{account_id}).get();
}

OperationResult CoreApi::claim_reward(std::string_view reward_id) {
  if (!service_) {
    return not_ready();
  }
  return service_->claim_reward(std::string{reward_id}).get();
}

OperationResult CoreApi::contribute(std::string_view cause_id, double amount) {
  if (!service_) {
    return not_ready();
  }
  return service_->contribute(std::string{cause_id}, amount).get();
}

OperationResult CoreApi::transfer_tokens(std::string_view to_address, double amount,
                                         std::string_view note) {
  if (!service_) {
    return not_ready();
  }
  return service_->transfer_tokens(std::string{to_address}, amount, std::string{note}).get();
}

OperationResult CoreApi::record_receive(std::string_view from_address, double amount,
                                        std::string_view note) {
  if (!service_) {
    return not_ready();
  }
  return service_->record_receive(std::string{from_address}, amount, std::string{note}).get();
}

OperationResult CoreApi::stake_tokens(double amount) {
  if (!service_) {
    return not_ready();
  }
  return service_->stake_tokens(amount).get();
}

OperationResult CoreApi::unstake_tokens(std::string_view stake_id) {
  if (!service_) {
    return not_ready();
  }
  return service_->unstake_tokens(std::string{stake_id}).get();
}

OperationResult CoreApi::record_activity(TransactionKind kind, std::string_view description) {
  if (!service_) {
    return not_ready();
  }
  return service_->record_activity(kind, std::string{description}).get();
}

bool CoreApi::unlock_reward(std::string_view reward_id) {
  return service_ && service_->unlock_reward(reward_id);
}

std::vector<std::string> CoreApi::record_progress(int day) {
  if (!service_) {
    return {};
  }
  return service_->record_progress(day);
}

Result CoreApi::add_reward(Reward reward) {
  if (!service_) {
    return not_ready().result;
  }
  return service_->add_reward(std::move(reward));
}

Result CoreApi::reset() {
  if (!service_) {
    return not_ready().result;
  }
  service_->reset();
  return Result::success("Ledger reset.");
}

LedgerSnapshot CoreApi::state() const {
  return service_ ? service_->state() : LedgerSnapshot{};
}

std::vector<Reward> CoreApi::all_rewards() const {
  return service_ ? service_->all_rewards() : std::vector<Reward>{};
}

std::vector<Reward> CoreApi::claimable_rewards() const {
  return service_ ? service_->claimable_rewards() : std::vector<Reward>{};
}

std::vector<Stake> CoreApi::all_stakes() const {
  return service_ ? service_->all_stakes() : std::vector<Stake>{};
}

std::vector<Transaction> CoreApi::transactions() const {
  return service_ ? service_->transactions() : std::vector<Transaction>{};
}

std::vector<Cause> CoreApi::supported_causes() const {
  return ledger::supported_causes();
}

double CoreApi::cause_total(std::string_view cause_id) const {
  return service_ ? service_->cause_total(cause_id) : 0.0;
}

Balance CoreApi::audit_balance() const {
  return service_ ? service_->audit_balance() : Balance{};
}

bool CoreApi::is_consistent() const {
  return !service_ || service_->is_consistent();
}

double CoreApi::projected_staking_reward(double amount, double days) const {
  return service_ ? service_->projected_staking_reward(amount, days) : 0.0;
}

double CoreApi::staking_apy_percent() const {
  return service_ ? service_->staking_apy_percent() : 0.0;
}

}  // namespace veg21
