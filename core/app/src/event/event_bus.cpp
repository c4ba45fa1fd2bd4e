#include "seatwise/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace seatwise {

namespace {

const char* eventName(const Event& event) {
  if (std::holds_alternative<EnrollmentUpdateEvent>(event)) {
    return "EnrollmentUpdateEvent";
  }
  if (std::holds_alternative<EnrollmentRejectedEvent>(event)) {
    return "EnrollmentRejectedEvent";
  }
  return "SeatAvailableEvent";
}

}  // namespace

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const SubscriberEntry& entry) { return entry.first == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// Snapshot under the lock, deliver without it. A failing subscriber is
// reported and skipped; the enroll/drop that published the event carries on.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& entry : snapshot) {
    try {
      entry.second(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] subscriber " << entry.first << " failed on "
                << eventName(event) << ": " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[EventBus] subscriber " << entry.first << " failed on "
                << eventName(event) << ": unknown exception\n";
    }
  }
}

}  // namespace seatwise
