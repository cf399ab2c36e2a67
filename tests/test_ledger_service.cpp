#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/crypto/id_source.hpp"
#include "core/model/app_meta.hpp"
#include "core/service/clock.hpp"
#include "core/service/ledger_service.hpp"
#include "core/storage/kv_backend.hpp"
#include "core/storage/store.hpp"
#include "core/util/log.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "veg21-ledger-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

class FailingBackend final : public veg21::IKeyValueBackend {
public:
  [[nodiscard]] std::optional<std::string> get(std::string_view) const override {
    return std::nullopt;
  }
  veg21::Result put(std::string_view key, std::string_view) override {
    ++writes;
    return veg21::Result::failure(veg21::ErrorKind::PersistenceFailure,
                                  "disk full: " + std::string{key});
  }
  veg21::Result erase(std::string_view) override {
    return veg21::Result::failure(veg21::ErrorKind::PersistenceFailure, "read-only");
  }

  int writes = 0;
};

struct Harness {
  std::shared_ptr<veg21::ManualClock> clock = std::make_shared<veg21::ManualClock>();
  std::shared_ptr<veg21::IKeyValueBackend> backend = std::make_shared<veg21::MemoryKeyValueBackend>();
  std::shared_ptr<veg21::SequentialIdSource> ids = std::make_shared<veg21::SequentialIdSource>();
  veg21::LedgerConfig config;

  [[nodiscard]] veg21::LedgerDependencies deps() const {
    return {.clock = clock, .backend = backend, .ids = ids};
  }
  [[nodiscard]] std::unique_ptr<veg21::LedgerService> make() const {
    return std::make_unique<veg21::LedgerService>(config, deps());
  }
};

// Records channel names in delivery order from any thread.
struct ChannelRecorder {
  std::mutex mutex;
  std::vector<veg21::Channel> seen;

  void attach(veg21::LedgerService& service) {
    for (const auto channel : {veg21::Channel::StateChanged, veg21::Channel::BalanceUpdated,
                               veg21::Channel::RewardClaimed, veg21::Channel::ContributionMade}) {
      (void)service.on(channel, [this](const veg21::LedgerEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(event.channel);
      });
    }
  }

  std::vector<veg21::Channel> take() {
    std::lock_guard<std::mutex> lock(mutex);
    auto out = seen;
    seen.clear();
    return out;
  }
};

bool near(double lhs, double rhs) {
  return std::abs(lhs - rhs) < 1e-9;
}

void test_scenario_flow() {
  Harness h;
  auto service = h.make();
  ChannelRecorder recorder;
  recorder.attach(*service);

  const auto init = service->initialize("acct-1").get();
  assert(init.ok());
  assert(service->balance().primary == 100.0);
  assert(service->balance().secondary == 0.5);
  assert((recorder.take() ==
          std::vector<veg21::Channel>{veg21::Channel::BalanceUpdated, veg21::Channel::StateChanged}));

  const auto again = service->initialize("acct-2").get();
  assert(again.ok());
  assert(!again.transaction.has_value());
  assert(service->state().account_id == "acct-1");
  assert((recorder.take() == std::vector<veg21::Channel>{veg21::Channel::StateChanged}));

  assert(service->unlock_reward("day_1_bonus"));
  assert((recorder.take() == std::vector<veg21::Channel>{veg21::Channel::StateChanged}));

  const auto claim = service->claim_reward("day_1_bonus").get();
  assert(claim.ok());
  assert(claim.transaction->kind() == veg21::TransactionKind::ClaimReward);
  assert(service->balance().primary == 150.0);
  assert(service->balance().secondary == 0.5);
  assert(service->state().total_earned == 50.0);
  assert((recorder.take() ==
          std::vector<veg21::Channel>{veg21::Channel::BalanceUpdated, veg21::Channel::RewardClaimed,
                                      veg21::Channel::StateChanged}));

  const auto stake = service->stake_tokens(100.0).get();
  assert(stake.ok());
  assert(service->balance().primary == 50.0);
  assert(service->state().total_staked == 100.0);
  assert(service->active_stakes().size() == 1);

  const auto unstake = service->unstake_tokens(stake.stake->id).get();
  assert(unstake.ok());
  assert(service->balance().primary == 150.0);
  assert(service->state().total_staked == 0.0);
  assert(service->active_stakes().empty());
  assert(service->all_stakes().size() == 1);

  const auto contribution = service->contribute("animal_sanctuary", 20.0).get();
  assert(contribution.ok());
  (void)recorder.take();

  const auto history = service->transactions();
  assert(history.size() == 5);
  assert(history.front().kind() == veg21::TransactionKind::Grant);
  assert(service->audit_balance() == service->balance());
  assert(service->is_consistent());
  assert(service->cause_total("animal_sanctuary") == 20.0);
  assert(service->contributions_by_cause("animal_sanctuary").size() == 1);
  assert(service->contributions().size() == 1);
  assert(service->supported_causes().size() == 3);
  assert(service->staking_apy_percent() == 5.0);
  assert(near(service->projected_staking_reward(1000.0, 365.0), 50.0));
}

void test_contribution_events() {
  Harness h;
  auto service = h.make();
  (void)service->initialize("acct").get();

  ChannelRecorder recorder;
  recorder.attach(*service);
  std::string seen_cause;
  (void)service->on(veg21::Channel::ContributionMade, [&](const veg21::LedgerEvent& event) {
    seen_cause = std::get<veg21::ContributionMadeEvent>(event.payload).contribution.cause_id;
  });

  assert(service->contribute("vegan_outreach", 10.0).get().ok());
  assert((recorder.take() ==
          std::vector<veg21::Channel>{veg21::Channel::BalanceUpdated,
                                      veg21::Channel::ContributionMade,
                                      veg21::Channel::StateChanged}));
  assert(seen_cause == "vegan_outreach");

  const auto rejected = service->contribute("vegan_outreach", 1000.0).get();
  assert(rejected.error() == veg21::ErrorKind::InsufficientBalance);
  assert(service->balance().primary == 90.0);
  assert(recorder.take().empty());
}

void test_exactly_once_claim_under_concurrency() {
  Harness h;
  auto service = h.make();
  (void)service->initialize("acct").get();
  assert(service->unlock_reward("week_1_milestone"));

  std::vector<std::future<veg21::OperationResult>> claims;
  for (int i = 0; i < 6; ++i) {
    claims.push_back(service->claim_reward("week_1_milestone"));
  }

  int ok = 0;
  int already = 0;
  for (auto& claim : claims) {
    const auto result = claim.get();
    if (result.ok()) {
      ++ok;
    } else if (result.error() == veg21::ErrorKind::AlreadyClaimed) {
      ++already;
    }
  }
  assert(ok == 1);
  assert(already == 5);
  assert(service->balance().primary == 200.0);
  assert(service->transactions().size() == 2);
}

void test_idempotent_unlock() {
  Harness h;
  auto service = h.make();
  (void)service->initialize("acct").get();
  ChannelRecorder recorder;
  recorder.attach(*service);

  const auto before = service->transactions().size();
  assert(service->unlock_reward("community_champion"));
  assert(!service->unlock_reward("community_champion"));
  assert(!service->unlock_reward("does_not_exist"));
  assert(recorder.take().size() == 1);
  assert(service->transactions().size() == before);
  assert(service->has_milestone_completed("community_champion"));
  assert(service->claimable_rewards().size() == 1);
}

void test_progress_and_custom_rewards() {
  Harness h;
  auto service = h.make();
  const auto unlocked = service->record_progress(7);
  assert(unlocked.size() == 2);
  assert(service->record_progress(7).empty());
  assert(service->claimable_rewards().size() == 2);

  veg21::Reward custom;
  custom.id = "daily_check_in";
  custom.category = veg21::RewardCategory::Daily;
  custom.amount = 2.0;
  custom.milestone_day = 3;
  assert(service->add_reward(custom).ok);
  assert(service->add_reward(custom).error == veg21::ErrorKind::DuplicateId);
  assert(service->all_rewards().size() == 6);
  assert(!service->has_milestone_completed("daily_check_in"));
  assert(service->record_progress(3).size() == 1);
}

void test_staking_interest_over_a_year() {
  Harness h;
  h.config.starting_primary = 1000.0;
  auto service = h.make();
  (void)service->initialize("acct").get();

  const auto stake = service->stake_tokens(1000.0).get();
  assert(stake.ok());
  assert(service->balance().primary == 0.0);
  h.clock->advance(std::chrono::hours{24 * 365});
  const auto closed = service->unstake_tokens(stake.stake->id).get();
  assert(closed.ok());
  assert(near(closed.transaction->amount, 1050.0));
  assert(near(service->balance().primary, 1050.0));
  assert(near(service->state().total_staking_rewards, 50.0));
  assert(near(service->all_stakes().front().accrued_rewards, 50.0));
  assert(service->is_consistent());

  const auto quick = service->stake_tokens(1000.0).get();
  const auto back = service->unstake_tokens(quick.stake->id).get();
  assert(back.transaction->amount == 1000.0);
  assert(service->unstake_tokens(quick.stake->id).get().error() == veg21::ErrorKind::NotFound);
}

void test_stake_unstake_race() {
  Harness h;
  auto service = h.make();
  (void)service->initialize("acct").get();
  const auto stake = service->stake_tokens(60.0).get();

  auto first = service->unstake_tokens(stake.stake->id);
  auto second = service->unstake_tokens(stake.stake->id);
  auto overdraw = service->stake_tokens(150.0);
  const auto a = first.get();
  const auto b = second.get();
  assert(a.ok() != b.ok());
  assert((a.ok() ? b : a).error() == veg21::ErrorKind::NotFound);
  assert(overdraw.get().error() == veg21::ErrorKind::InsufficientBalance);
  assert(service->balance().primary == 100.0);
  assert(service->balance().primary >= 0.0);
}

void test_transfers_receive_and_activity() {
  Harness h;
  auto service = h.make();
  (void)service->initialize("acct").get();

  assert(service->transfer_tokens("short", 5.0).get().error() == veg21::ErrorKind::InvalidAddress);
  assert(service->transfer_tokens("0xabcdef123456", 0.0).get().error() ==
         veg21::ErrorKind::InvalidAmount);
  const auto sent = service->transfer_tokens("0xabcdef123456", 25.0, "groceries").get();
  assert(sent.ok());
  assert(std::get<veg21::TransferDetail>(sent.transaction->detail).note == "groceries");
  assert(service->balance().primary == 75.0);

  const auto received = service->record_receive("0xfriend000001", 5.0).get();
  assert(received.ok());
  assert(service->balance().primary == 80.0);

  const auto check_in =
      service->record_activity(veg21::TransactionKind::CheckIn, "day 2 check-in").get();
  assert(check_in.ok());
  assert(service->balance().primary == 80.0);
  assert(service->transactions().back().kind() == veg21::TransactionKind::CheckIn);
  assert(service->is_consistent());
}

void test_persistence_round_trip() {
  Harness h;
  std::string stake_id;
  veg21::Timestamp opened_at;
  {
    auto service = h.make();
    (void)service->initialize("acct").get();
    const auto stake = service->stake_tokens(40.0).get();
    stake_id = stake.stake->id;
    opened_at = stake.stake->opened_at;
    assert(service->unlock_reward("day_1_bonus"));
  }

  h.clock->advance(std::chrono::hours{1});
  auto reopened = h.make();
  const auto state = reopened->state();
  assert(state.initialized);
  assert(state.account_id == "acct");
  assert(state.balance.primary == 60.0);
  assert(state.total_staked == 40.0);
  assert(state.stakes.size() == 1);
  assert(state.stakes.front().id == stake_id);
  assert(state.stakes.front().is_active());
  assert(state.stakes.front().opened_at == opened_at);
  assert(reopened->has_milestone_completed("day_1_bonus"));
  assert(reopened->transactions().size() == 2);
  assert(reopened->is_consistent());

  assert(reopened->unstake_tokens(stake_id).get().ok());
  assert(reopened->balance().primary > 100.0);
}

void test_reset_restores_defaults() {
  Harness h;
  auto service = h.make();
  (void)service->initialize("acct").get();
  assert(service->unlock_reward("day_1_bonus"));
  assert(service->claim_reward("day_1_bonus").get().ok());
  (void)service->stake_tokens(10.0).get();

  ChannelRecorder recorder;
  recorder.attach(*service);
  service->reset();
  assert((recorder.take() == std::vector<veg21::Channel>{veg21::Channel::StateChanged}));

  const auto state = service->state();
  assert(!state.initialized);
  assert(state.balance.primary == 0.0);
  assert(state.balance.secondary == 0.0);
  assert(state.stakes.empty());
  assert(state.rewards.size() == 5);
  assert(std::ranges::none_of(state.rewards, [](const veg21::Reward& r) { return r.unlocked(); }));
  assert(service->transactions().empty());
  assert(!h.backend->get(veg21::kStateKey).has_value());
  assert(!h.backend->get(veg21::kTransactionsKey).has_value());

  assert(service->initialize("acct").get().ok());
  assert(service->balance().primary == 100.0);
  assert(service->is_consistent());
}

void test_corrupt_storage_falls_back() {
  Harness h;
  assert(h.backend->put(veg21::kStateKey, "\x7f garbage \t\t").ok);
  assert(h.backend->put(veg21::kTransactionsKey, "# veg21 ledger transactions v1\ntx\tx\n").ok);

  auto service = h.make();
  const auto state = service->state();
  assert(!state.initialized);
  assert(state.rewards.size() == 5);
  assert(service->transactions().empty());
  assert(service->initialize("acct").get().ok());
  assert(service->is_consistent());
}

void test_failing_backend_keeps_memory_state() {
  Harness h;
  auto failing = std::make_shared<FailingBackend>();
  h.backend = failing;
  auto service = h.make();

  const auto init = service->initialize("acct").get();
  assert(init.ok());
  assert(service->stake_tokens(30.0).get().ok());
  assert(service->balance().primary == 70.0);
  assert(failing->writes > 0);
  service->reset();
  assert(service->balance().primary == 0.0);
}

void test_subscribers_cannot_break_commits() {
  Harness h;
  auto service = h.make();
  int balance_events = 0;
  (void)service->on(veg21::Channel::BalanceUpdated, [](const veg21::LedgerEvent&) {
    throw std::runtime_error("broken subscriber");
  });
  const auto counter = service->on(veg21::Channel::BalanceUpdated,
                                   [&](const veg21::LedgerEvent&) { ++balance_events; });

  assert(service->initialize("acct").get().ok());
  assert(balance_events == 1);
  assert(service->balance().primary == 100.0);

  assert(service->off(veg21::Channel::BalanceUpdated, counter));
  assert(!service->off(veg21::Channel::BalanceUpdated, counter));
  assert(service->stake_tokens(1.0).get().ok());
  assert(balance_events == 1);
}

void test_non_standard_throw_is_contained() {
  Harness h;
  auto service = h.make();
  int notified = 0;
  (void)service->on(veg21::Channel::BalanceUpdated, [](const veg21::LedgerEvent&) { throw 42; });
  (void)service->on(veg21::Channel::BalanceUpdated,
                    [&](const veg21::LedgerEvent&) { ++notified; });

  assert(service->initialize("acct").get().ok());
  assert(notified == 1);
  assert(service->stake_tokens(5.0).get().ok());
  assert(notified == 2);
  assert(service->balance().primary == 95.0);
}

void test_events_follow_commit_order() {
  Harness h;
  auto service = h.make();
  assert(service->initialize("acct").get().ok());

  std::promise<void> entered;
  std::promise<void> release;
  auto entered_future = entered.get_future();
  std::shared_future<void> released = release.get_future().share();
  bool paused = false;
  (void)service->on(veg21::Channel::BalanceUpdated, [&](const veg21::LedgerEvent&) {
    if (!paused) {
      paused = true;
      entered.set_value();
      released.wait();
    }
  });

  std::mutex mutex;
  std::vector<veg21::LedgerSnapshot> states;
  (void)service->on(veg21::Channel::StateChanged, [&](const veg21::LedgerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex);
    states.push_back(std::get<veg21::LedgerSnapshot>(event.payload));
  });

  auto staked = service->stake_tokens(10.0);
  entered_future.wait();
  // The worker is still delivering the stake events; this commit lands after it.
  assert(service->unlock_reward("day_1_bonus"));
  release.set_value();
  assert(staked.get().ok());

  std::lock_guard<std::mutex> lock(mutex);
  assert(states.size() == 2);
  assert(states[0].stakes.size() == 1);
  assert(!states[0].rewards.front().unlocked());
  assert(states[1].rewards.front().unlocked());
  assert(states[1].balance.primary == 90.0);
}

void test_audit_covers_both_balances() {
  Harness h;
  {
    auto service = h.make();
    assert(service->initialize("acct").get().ok());
    assert((service->audit_balance() == veg21::Balance{.primary = 100.0, .secondary = 0.5}));
    assert(service->is_consistent());
  }

  veg21::Store store(h.backend);
  veg21::LedgerSnapshot stored = store.load();
  stored.balance.secondary = 3.0;
  assert(store.save(stored).ok);

  auto reopened = h.make();
  assert(reopened->balance().primary == 100.0);
  assert(reopened->audit_balance().secondary == 0.5);
  assert(!reopened->is_consistent());
}

void test_reads_do_not_wait_for_confirmation() {
  using namespace std::chrono_literals;
  using steady = std::chrono::steady_clock;

  veg21::LedgerConfig config;
  config.initialize_delay = 0ms;
  config.claim_delay = 200ms;
  config.operation_delay = 200ms;
  auto service = std::make_unique<veg21::LedgerService>(
      config, veg21::LedgerDependencies{
                  .clock = veg21::make_system_clock(),
                  .backend = std::make_shared<veg21::MemoryKeyValueBackend>(),
                  .ids = std::make_shared<veg21::SequentialIdSource>(),
              });
  assert(service->initialize("acct").get().ok());
  assert(service->unlock_reward("day_1_bonus"));

  const auto started = steady::now();
  auto first = service->claim_reward("day_1_bonus");
  auto second = service->claim_reward("day_1_bonus");
  const veg21::LedgerSnapshot during = service->state();
  const veg21::Balance balance = service->balance();
  assert(steady::now() - started < 100ms);
  assert(first.wait_for(0ms) == std::future_status::timeout);
  assert(balance.primary == 100.0);
  assert(!during.rewards.front().claimed());

  const auto claimed = first.get();
  const auto repeated = second.get();
  assert(claimed.ok());
  assert(repeated.error() == veg21::ErrorKind::AlreadyClaimed);
  assert(steady::now() - started >= 400ms);
  assert(service->balance().primary == 150.0);
  assert(service->transactions().size() == 2);
}

void test_handlers_may_read_and_unlock() {
  Harness h;
  auto service = h.make();
  double observed = -1.0;
  bool unlocked_from_handler = false;
  (void)service->on(veg21::Channel::BalanceUpdated, [&](const veg21::LedgerEvent& event) {
    observed = service->balance().primary;
    assert(std::get<veg21::Balance>(event.payload).primary == observed);
    if (!unlocked_from_handler) {
      unlocked_from_handler = service->unlock_reward("community_champion");
    }
  });

  assert(service->initialize("acct").get().ok());
  assert(observed == 100.0);
  assert(unlocked_from_handler);
  assert(service->has_milestone_completed("community_champion"));
}

void test_destructor_drains_queue() {
  Harness h;
  std::vector<std::future<veg21::OperationResult>> pending;
  {
    auto service = h.make();
    pending.push_back(service->initialize("acct"));
    pending.push_back(service->stake_tokens(10.0));
    pending.push_back(service->contribute("environmental_fund", 5.0));
  }
  for (auto& result : pending) {
    assert(result.get().ok());
  }

  auto reopened = h.make();
  assert(reopened->balance().primary == 85.0);
  assert(reopened->transactions().size() == 3);
}

void test_missing_dependency_rejected() {
  Harness h;
  auto deps = h.deps();
  deps.clock.reset();
  bool threw = false;
  try {
    veg21::LedgerService service(h.config, deps);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void test_core_api_with_file_backend() {
  const auto dir = temp_dir("core-api");
  veg21::LedgerConfig config;
  config.data_dir = dir.string();
  auto clock = std::make_shared<veg21::ManualClock>();

  veg21::CoreApi idle;
  assert(!idle.ready());
  assert(idle.initialize("acct").error() == veg21::ErrorKind::InvalidConfig);

  {
    veg21::CoreApi api;
    const veg21::Result init = api.init(config, veg21::LedgerDependencies{
                                                    .clock = clock,
                                                    .backend = veg21::make_file_backend(config.data_dir),
                                                    .ids = std::make_shared<veg21::SequentialIdSource>(),
                                                });
    assert(init.ok);
    assert(api.initialize("acct-file").ok());
    assert(api.unlock_reward("day_1_bonus"));
    assert(api.claim_reward("day_1_bonus").ok());
    assert(api.stake_tokens(50.0).ok());
    assert(std::filesystem::exists(dir / "veg21_ledger_state.dat"));
    assert(std::filesystem::exists(dir / "veg21_ledger_transactions.dat"));
  }

  veg21::CoreApi reopened;
  assert(reopened.init(config, veg21::LedgerDependencies{
                                   .clock = clock,
                                   .backend = veg21::make_file_backend(config.data_dir),
                                   .ids = std::make_shared<veg21::SequentialIdSource>(),
                               })
             .ok);
  assert(reopened.state().balance.primary == 100.0);
  assert(reopened.all_stakes().size() == 1);
  assert(reopened.transactions().size() == 3);
  assert(reopened.is_consistent());
  assert(reopened.reset().ok);
  assert(!std::filesystem::exists(dir / "veg21_ledger_state.dat"));

  veg21::LedgerConfig bad = config;
  bad.annual_staking_rate = 2.0;
  veg21::CoreApi rejected;
  assert(rejected.init(bad).error == veg21::ErrorKind::InvalidConfig);
  assert(!rejected.ready());
}

}  // namespace

int main() {
  veg21::log::init(veg21::log::ERROR);

  test_scenario_flow();
  test_contribution_events();
  test_exactly_once_claim_under_concurrency();
  test_idempotent_unlock();
  test_progress_and_custom_rewards();
  test_staking_interest_over_a_year();
  test_stake_unstake_race();
  test_transfers_receive_and_activity();
  test_persistence_round_trip();
  test_reset_restores_defaults();
  test_corrupt_storage_falls_back();
  test_failing_backend_keeps_memory_state();
  test_subscribers_cannot_break_commits();
  test_non_standard_throw_is_contained();
  test_events_follow_commit_order();
  test_audit_covers_both_balances();
  test_reads_do_not_wait_for_confirmation();
  test_handlers_may_read_and_unlock();
  test_destructor_drains_queue();
  test_missing_dependency_rejected();
  test_core_api_with_file_backend();

  std::cout << "veg21_service_tests passed\n";
  return 0;
}
