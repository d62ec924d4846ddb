#pragma once

#include "arena/events/event.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Publish-subscribe channel over the Event variant. Each EventLoopThread owns
// one; the engine subscribes the analytics components to it.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, outside the lock.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Invoked for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Invoked only when the published event holds an EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // The callback may still run for a publish already in progress.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace arena
