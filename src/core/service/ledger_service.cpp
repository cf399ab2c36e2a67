#include "core/service/ledger_service.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "core/ledger/account.hpp"
#include "core/ledger/rewards.hpp"
#include "core/ledger/staking.hpp"
#include "core/ledger/transfers.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace veg21 {
namespace {

std::vector<LedgerEvent> events_for(const OperationResult& result, const LedgerSnapshot& snapshot) {
  std::vector<LedgerEvent> events;
  if (result.transaction.has_value()) {
    const Transaction& tx = *result.transaction;
    if (balance_effect(tx.kind()) != BalanceEffect::None) {
      events.push_back({.channel = Channel::BalanceUpdated, .payload = snapshot.balance});
    }
    if (result.reward.has_value() && tx.kind() == TransactionKind::ClaimReward) {
      events.push_back({.channel = Channel::RewardClaimed,
                        .payload = RewardClaimedEvent{.reward = *result.reward, .transaction = tx}});
    }
    if (result.contribution.has_value()) {
      events.push_back(
          {.channel = Channel::ContributionMade,
           .payload = ContributionMadeEvent{.contribution = *result.contribution, .transaction = tx}});
    }
  }
  events.push_back({.channel = Channel::StateChanged, .payload = snapshot});
  return events;
}

}  // namespace

LedgerDependencies make_default_dependencies(const LedgerConfig& config) {
  return {
      .clock = make_system_clock(),
      .backend = make_file_backend(config.data_dir),
      .ids = make_sodium_id_source(),
  };
}

LedgerService::LedgerService(LedgerConfig config, LedgerDependencies deps)
    : config_(std::move(config)),
      clock_(std::move(deps.clock)),
      ids_(std::move(deps.ids)),
      store_(deps.backend) {
  if (!clock_ || !ids_ || !deps.backend) {
    throw std::invalid_argument("LedgerService requires a clock, an id source and a backend.");
  }

  state_ = store_.load();
  log_ = ledger::TransactionLog(store_.load_log());
  if (state_.rewards.empty()) {
    state_.rewards = ledger::default_reward_catalogue();
    persist(state_, nullptr);
  }
  if (const Balance replayed = log_.replay_balance(); replayed != state_.balance) {
    LOG_WARN << "Loaded transaction log does not reproduce the stored balance ("
             << util::format_amount(replayed.primary) << "/"
             << util::format_amount(replayed.secondary, 4) << " vs "
             << util::format_amount(state_.balance.primary) << "/"
             << util::format_amount(state_.balance.secondary, 4) << ").";
  }
  LOG_DBG << "Ledger loaded: " << state_.rewards.size() << " rewards, " << state_.stakes.size()
          << " stakes, " << log_.size() << " transactions.";

  worker_ = std::thread(&LedgerService::worker_loop, this);
}

LedgerService::~LedgerService() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    should_stop_ = true;
  }
  queue_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::future<OperationResult> LedgerService::initialize(std::string account_id) {
  return enqueue("initialize", config_.initialize_delay,
                 [account_id = std::move(account_id)](LedgerSnapshot& state,
                                                      const ledger::OperationContext& ctx) {
                   return ledger::initialize_account(state, account_id, ctx);
                 });
}

std::future<OperationResult> LedgerService::claim_reward(std::string reward_id) {
  return enqueue("claim_reward", config_.claim_delay,
                 [reward_id = std::move(reward_id)](LedgerSnapshot& state,
                                                    const ledger::OperationContext& ctx) {
                   return ledger::claim_reward(state, reward_id, ctx);
                 });
}

std::future<OperationResult> LedgerService::contribute(std::string cause_id, double amount) {
  return enqueue("contribute", config_.operation_delay,
                 [cause_id = std::move(cause_id), amount](LedgerSnapshot& state,
                                                          const ledger::OperationContext& ctx) {
                   return ledger::contribute(state, cause_id, amount, ctx);
                 });
}

std::future<OperationResult> LedgerService::transfer_tokens(std::string to_address, double amount,
                                                            std::string note) {
  return enqueue("transfer", config_.operation_delay,
                 [to_address = std::move(to_address), amount, note = std::move(note)](
                     LedgerSnapshot& state, const ledger::OperationContext& ctx) {
                   return ledger::transfer_tokens(state, to_address, amount, note, ctx);
                 });
}

std::future<OperationResult> LedgerService::record_receive(std::string from_address, double amount,
                                                           std::string note) {
  return enqueue("receive", config_.operation_delay,
                 [from_address = std::move(from_address), amount, note = std::move(note)](
                     LedgerSnapshot& state, const ledger::OperationContext& ctx) {
                   return ledger::record_receive(state, from_address, amount, note, ctx);
                 });
}

std::future<OperationResult> LedgerService::stake_tokens(double amount) {
  return enqueue("stake_tokens", config_.operation_delay,
                 [amount](LedgerSnapshot& state, const ledger::OperationContext& ctx) {
                   return ledger::stake_tokens(state, amount, ctx);
                 });
}

std::future<OperationResult> LedgerService::unstake_tokens(std::string stake_id) {
  return enqueue("unstake_tokens", config_.operation_delay,
                 [stake_id = std::move(stake_id)](LedgerSnapshot& state,
                                                  const ledger::OperationContext& ctx) {
                   return ledger::unstake_tokens(state, stake_id, ctx);
                 });
}

std::future<OperationResult> LedgerService::record_activity(TransactionKind kind,
                                                            std::string description) {
  return enqueue("record_activity", config_.operation_delay,
                 [kind, description = std::move(description)](
                     LedgerSnapshot&, const ledger::OperationContext& ctx) {
                   return ledger::record_activity(kind, description, ctx);
                 });
}

bool LedgerService::unlock_reward(std::string_view reward_id) {
  {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);
    LedgerSnapshot snapshot;
    {
      std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
      if (!ledger::unlock_reward(state_, reward_id, clock_->now())) {
        return false;
      }
      snapshot = state_;
    }
    persist(snapshot, nullptr);
    queue_state_changed(std::move(snapshot));
  }
  LOG_INFO << "Reward unlocked: " << reward_id;
  deliver_events();
  return true;
}

std::vector<std::string> LedgerService::record_progress(int day) {
  std::vector<std::string> unlocked;
  {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);
    LedgerSnapshot snapshot;
    {
      std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
      unlocked = ledger::record_progress(state_, day, clock_->now());
      if (unlocked.empty()) {
        return unlocked;
      }
      snapshot = state_;
    }
    persist(snapshot, nullptr);
    queue_state_changed(std::move(snapshot));
  }
  LOG_INFO << "Challenge day " << day << " unlocked " << unlocked.size() << " reward(s).";
  deliver_events();
  return unlocked;
}

Result LedgerService::add_reward(Reward reward) {
  Result added;
  {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);
    LedgerSnapshot snapshot;
    {
      std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
      added = ledger::add_reward(state_, std::move(reward));
      if (!added.ok) {
        LOG_INFO << "add_reward rejected (" << error_kind_name(added.error)
                 << "): " << added.message;
        return added;
      }
      snapshot = state_;
    }
    persist(snapshot, nullptr);
    queue_state_changed(std::move(snapshot));
  }
  LOG_INFO << "Reward added: " << added.data;
  deliver_events();
  return added;
}

void LedgerService::reset() {
  {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);
    LedgerSnapshot snapshot;
    {
      std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
      state_ = ledger::make_default_snapshot();
      log_.clear();
      snapshot = state_;
    }
    if (const Result cleared = store_.reset(); !cleared.ok) {
      LOG_WARN << "Ledger reset could not clear storage (" << error_kind_name(cleared.error)
               << "): " << cleared.message;
    }
    queue_state_changed(std::move(snapshot));
  }
  LOG_INFO << "Ledger reset to defaults.";
  deliver_events();
}

SubscriptionId LedgerService::on(Channel channel, EventHandler handler) {
  return events_.subscribe(channel, std::move(handler));
}

bool LedgerService::off(Channel channel, SubscriptionId id) {
  return events_.unsubscribe(channel, id);
}

LedgerSnapshot LedgerService::state() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_;
}

Balance LedgerService::balance() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_.balance;
}

std::vector<Reward> LedgerService::claimable_rewards() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger::claimable_rewards(state_);
}

std::vector<Reward> LedgerService::all_rewards() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_.rewards;
}

bool LedgerService::has_milestone_completed(std::string_view reward_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger::has_milestone_completed(state_, reward_id);
}

std::vector<Stake> LedgerService::active_stakes() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger::active_stakes(state_);
}

std::vector<Stake> LedgerService::all_stakes() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_.stakes;
}

std::vector<Contribution> LedgerService::contributions() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_.contributions;
}

std::vector<Contribution> LedgerService::contributions_by_cause(std::string_view cause_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger::contributions_by_cause(state_, cause_id);
}

double LedgerService::cause_total(std::string_view cause_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger::cause_total(state_, cause_id);
}

std::vector<Cause> LedgerService::supported_causes() const {
  return ledger::supported_causes();
}

std::vector<Transaction> LedgerService::transactions() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return log_.entries();
}

Balance LedgerService::audit_balance() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return log_.replay_balance();
}

bool LedgerService::is_consistent() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return log_.replay_balance() == state_.balance;
}

double LedgerService::projected_staking_reward(double amount, double days) const {
  return ledger::projected_interest(amount, config_.annual_staking_rate, days);
}

double LedgerService::staking_apy_percent() const {
  return config_.annual_staking_rate * 100.0;
}

std::future<OperationResult> LedgerService::enqueue(std::string operation,
                                                    std::chrono::milliseconds delay,
                                                    Mutation mutation) {
  auto promise = std::make_shared<std::promise<OperationResult>>();
  auto future = promise->get_future();

  auto task = [this, promise, delay, operation = std::move(operation),
               mutation = std::move(mutation)]() {
    try {
      clock_->sleep_for(delay);
      promise->set_value(commit(operation, mutation));
    } catch (const std::exception& ex) {
      LOG_ERR << operation << " failed: " << ex.what();
      promise->set_exception(std::current_exception());
    } catch (...) {
      LOG_ERR << operation << " failed with a non-standard exception.";
      promise->set_exception(std::current_exception());
    }
  };

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(task));
  }
  queue_cv_.notify_one();
  return future;
}

OperationResult LedgerService::commit(std::string_view operation, const Mutation& mutation) {
  OperationResult result;
  LedgerSnapshot snapshot;
  {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);
    std::vector<Transaction> log_copy;
    {
      std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
      const ledger::OperationContext ctx{.now = clock_->now(), .ids = *ids_, .config = config_};
      result = mutation(state_, ctx);
      if (!result.ok()) {
        LOG_INFO << operation << " rejected (" << error_kind_name(result.error())
                 << "): " << result.result.message;
        return result;
      }
      if (result.transaction.has_value()) {
        log_.append(*result.transaction);
        log_copy = log_.entries();
      }
      snapshot = state_;
    }
    persist(snapshot, result.transaction.has_value() ? &log_copy : nullptr);
    queue_events(events_for(result, snapshot));
  }

  if (result.transaction.has_value()) {
    LOG_INFO << operation << " committed: " << transaction_kind_name(result.transaction->kind())
             << " " << util::format_amount(result.transaction->amount) << " "
             << result.transaction->tx_hash;
  } else {
    LOG_INFO << operation << " committed: " << result.result.message;
  }

  deliver_events();
  return result;
}

void LedgerService::persist(const LedgerSnapshot& snapshot, const std::vector<Transaction>* log) {
  if (const Result saved = store_.save(snapshot); !saved.ok) {
    LOG_WARN << "Ledger state not persisted (" << error_kind_name(saved.error)
             << "): " << saved.message;
  }
  if (log == nullptr) {
    return;
  }
  if (const Result saved = store_.save_log(*log); !saved.ok) {
    LOG_WARN << "Transaction log not persisted (" << error_kind_name(saved.error)
             << "): " << saved.message;
  }
}

void LedgerService::queue_events(std::vector<LedgerEvent> events) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  for (auto& event : events) {
    pending_events_.push_back(std::move(event));
  }
}

void LedgerService::queue_state_changed(LedgerSnapshot snapshot) {
  std::vector<LedgerEvent> events;
  events.push_back({.channel = Channel::StateChanged, .payload = std::move(snapshot)});
  queue_events(std::move(events));
}

void LedgerService::deliver_events() {
  std::unique_lock<std::mutex> lock(publish_mutex_);
  if (delivering_) {
    // The thread already delivering picks these up in commit order.
    return;
  }
  delivering_ = true;
  while (!pending_events_.empty()) {
    LedgerEvent event = std::move(pending_events_.front());
    pending_events_.pop_front();
    lock.unlock();
    events_.publish(event);
    lock.lock();
  }
  delivering_ = false;
}

void LedgerService::worker_loop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return should_stop_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

}  // namespace veg21
