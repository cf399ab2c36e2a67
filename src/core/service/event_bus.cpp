#include "core/service/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "core/util/log.hpp"

namespace veg21 {

std::string_view channel_name(Channel channel) {
  switch (channel) {
    case Channel::StateChanged:
      return "state_changed";
    case Channel::BalanceUpdated:
      return "balance_updated";
    case Channel::RewardClaimed:
      return "reward_claimed";
    case Channel::ContributionMade:
      return "contribution_made";
  }
  return "state_changed";
}

std::optional<Channel> channel_from_name(std::string_view text) {
  for (const Channel channel : {Channel::StateChanged, Channel::BalanceUpdated,
                                Channel::RewardClaimed, Channel::ContributionMade}) {
    if (channel_name(channel) == text) {
      return channel;
    }
  }
  return std::nullopt;
}

SubscriptionId EventBus::subscribe(Channel channel, EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscriptions_.push_back({.id = id, .channel = channel, .handler = std::move(handler)});
  return id;
}

bool EventBus::unsubscribe(Channel channel, SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::ranges::find_if(subscriptions_, [&](const Subscription& sub) {
    return sub.id == id && sub.channel == channel;
  });
  if (it == subscriptions_.end()) {
    return false;
  }
  subscriptions_.erase(it);
  return true;
}

void EventBus::publish(const LedgerEvent& event) const {
  std::vector<Subscription> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sub : subscriptions_) {
      if (sub.channel == event.channel) {
        targets.push_back(sub);
      }
    }
  }

  for (const auto& sub : targets) {
    try {
      sub.handler(event);
    } catch (const std::exception& ex) {
      LOG_ERR << "Subscriber " << sub.id << " on " << channel_name(event.channel)
              << " threw: " << ex.what();
    } catch (...) {
      LOG_ERR << "Subscriber " << sub.id << " on " << channel_name(event.channel)
              << " threw a non-standard exception.";
    }
  }
}

std::size_t EventBus::subscriber_count(Channel channel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::ranges::count(subscriptions_, channel, &Subscription::channel));
}

}  // namespace veg21
