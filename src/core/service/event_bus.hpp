#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "core/model/types.hpp"

namespace veg21 {

enum class Channel {
  StateChanged,
  BalanceUpdated,
  RewardClaimed,
  ContributionMade,
};

struct RewardClaimedEvent {
  Reward reward;
  Transaction transaction;
};

struct ContributionMadeEvent {
  Contribution contribution;
  Transaction transaction;
};

using EventPayload = std::variant<LedgerSnapshot, Balance, RewardClaimedEvent, ContributionMadeEvent>;

struct LedgerEvent {
  Channel channel = Channel::StateChanged;
  EventPayload payload;
};

using SubscriptionId = std::uint64_t;
using EventHandler = std::function<void(const LedgerEvent&)>;

std::string_view channel_name(Channel channel);
std::optional<Channel> channel_from_name(std::string_view text);

// Delivers events to handlers in registration order on the publishing
// thread. Handlers may subscribe or unsubscribe from inside a callback; the
// change applies from the next publish.
class EventBus {
public:
  SubscriptionId subscribe(Channel channel, EventHandler handler);
  bool unsubscribe(Channel channel, SubscriptionId id);
  void publish(const LedgerEvent& event) const;

  [[nodiscard]] std::size_t subscriber_count(Channel channel) const;

private:
  struct Subscription {
    SubscriptionId id = 0;
    Channel channel = Channel::StateChanged;
    EventHandler handler;
  };

  mutable std::mutex mutex_;
  std::vector<Subscription> subscriptions_;
  SubscriptionId next_id_ = 1;
};

}  // namespace veg21
