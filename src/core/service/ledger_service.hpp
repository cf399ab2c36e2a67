#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/crypto/id_source.hpp"
#include "core/ledger/transaction_log.hpp"
#include "core/model/types.hpp"
#include "core/service/clock.hpp"
#include "core/service/event_bus.hpp"
#include "core/storage/kv_backend.hpp"
#include "core/storage/store.hpp"

namespace veg21 {

struct LedgerDependencies {
  std::shared_ptr<IClock> clock;
  std::shared_ptr<IKeyValueBackend> backend;
  std::shared_ptr<IIdSource> ids;
};

// System clock, file backend under config.data_dir and libsodium ids.
LedgerDependencies make_default_dependencies(const LedgerConfig& config);

// Owns the ledger state for one account. Mutating operations that simulate a
// confirmation delay run on a single worker thread in submission order and
// hand back a future; the rest commit synchronously on the calling thread.
// Every commit holds commit_mutex_, so validation and mutation are atomic.
// Events reach subscribers in commit order; a commit made while another
// thread is delivering is handed to that thread.
class LedgerService {
public:
  // Throws std::invalid_argument when a dependency is missing.
  LedgerService(LedgerConfig config, LedgerDependencies deps);
  ~LedgerService();

  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;

  std::future<OperationResult> initialize(std::string account_id);
  std::future<OperationResult> claim_reward(std::string reward_id);
  std::future<OperationResult> contribute(std::string cause_id, double amount);
  std::future<OperationResult> transfer_tokens(std::string to_address, double amount,
                                               std::string note = {});
  std::future<OperationResult> record_receive(std::string from_address, double amount,
                                              std::string note = {});
  std::future<OperationResult> stake_tokens(double amount);
  std::future<OperationResult> unstake_tokens(std::string stake_id);
  std::future<OperationResult> record_activity(TransactionKind kind, std::string description);

  bool unlock_reward(std::string_view reward_id);
  std::vector<std::string> record_progress(int day);
  Result add_reward(Reward reward);
  void reset();

  SubscriptionId on(Channel channel, EventHandler handler);
  bool off(Channel channel, SubscriptionId id);

  [[nodiscard]] LedgerSnapshot state() const;
  [[nodiscard]] Balance balance() const;
  [[nodiscard]] std::vector<Reward> claimable_rewards() const;
  [[nodiscard]] std::vector<Reward> all_rewards() const;
  [[nodiscard]] bool has_milestone_completed(std::string_view reward_id) const;
  [[nodiscard]] std::vector<Stake> active_stakes() const;
  [[nodiscard]] std::vector<Stake> all_stakes() const;
  [[nodiscard]] std::vector<Contribution> contributions() const;
  [[nodiscard]] std::vector<Contribution> contributions_by_cause(std::string_view cause_id) const;
  [[nodiscard]] double cause_total(std::string_view cause_id) const;
  [[nodiscard]] std::vector<Cause> supported_causes() const;
  [[nodiscard]] std::vector<Transaction> transactions() const;
  [[nodiscard]] Balance audit_balance() const;
  [[nodiscard]] bool is_consistent() const;
  [[nodiscard]] double projected_staking_reward(double amount, double days) const;
  [[nodiscard]] double staking_apy_percent() const;
  [[nodiscard]] const LedgerConfig& config() const { return config_; }

private:
  using Mutation =
      std::function<OperationResult(LedgerSnapshot&, const ledger::OperationContext&)>;

  std::future<OperationResult> enqueue(std::string operation, std::chrono::milliseconds delay,
                                       Mutation mutation);
  OperationResult commit(std::string_view operation, const Mutation& mutation);
  void persist(const LedgerSnapshot& snapshot, const std::vector<Transaction>* log);
  // Called with commit_mutex_ held so queued events keep commit order.
  void queue_events(std::vector<LedgerEvent> events);
  void queue_state_changed(LedgerSnapshot snapshot);
  // Delivers queued events unless another call is already delivering them.
  void deliver_events();
  void worker_loop();

  LedgerConfig config_;
  std::shared_ptr<IClock> clock_;
  std::shared_ptr<IIdSource> ids_;
  Store store_;
  EventBus events_;

  std::mutex commit_mutex_;
  mutable std::shared_mutex state_mutex_;
  LedgerSnapshot state_;
  ledger::TransactionLog log_;

  std::mutex publish_mutex_;
  std::deque<LedgerEvent> pending_events_;
  bool delivering_ = false;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<std::function<void()>> queue_;
  bool should_stop_ = false;
  std::thread worker_;
};

}  // namespace veg21
