#pragma once

#include "escrow/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish/subscribe channel for escrow,
// settlement and governance notifications. Components that change state
// (EscrowRegistry, Governance) publish; the EscrowEngine subscribes to
// persist snapshots and to forward telemetry to the IPC server.
//
// Publishers never hold their own locks while publishing, so a subscriber
// may call back into the registry or governance without deadlocking.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. Callbacks run on the publishing thread before publish() returns.
// Two publishers on different threads may interleave their deliveries;
// per-escrow ordering holds because one escrow's operations are serialized
// by the registry.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::get_if / std::visit to pick a kind.
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback for every published event.
  // Returns the id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only fires when the published variant holds
  // EventType (e.g. SettlementEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes a subscription. A publish() already in progress on another
  // thread may still deliver its current event to the removed callback.
  // Unknown ids are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every subscriber with `event` on the calling thread. The
  // subscriber list is copied under the mutex and the callbacks run without
  // it, so a callback may publish or unsubscribe re-entrantly.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions (snapshot).
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: wrap in a generic callback that filters on the variant.
// -----------------------------------------------------------------------------
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

}  // namespace escrow
