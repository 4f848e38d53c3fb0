#pragma once

#include "rebal/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish/subscribe channel for cycle telemetry.
//
// @details
// The RebalanceEngine and the RiskGovernor publish what happened during a
// cycle (faults, breaches, approved orders, execution reports, summary).
// Subscribers are loggers, tests, and the bridge that forwards events to the
// IPC server's telemetry queue. The decision logic never reads from the bus;
// removing every subscriber changes nothing about which orders are produced.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread. Callbacks run on
//   the publishing thread before publish() returns, outside the internal
//   lock, so a callback may publish or unsubscribe without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish already in flight on another thread
  // may still deliver one last event to the removed callback.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// Wrap the typed callback in a generic one that filters on the variant.
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

}  // namespace rebal
