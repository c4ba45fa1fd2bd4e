#pragma once

#include "seatwise/notification/i_notification_sink.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// WaitlistQueue: per-section FIFO of waiting students
// -----------------------------------------------------------------------------
//
// @brief  Keeps one first-in-first-out queue of student ids per section and
//         notifies subscribers whenever a student is taken off a queue.
//
// @details
// Queues are created lazily by the first enqueue() for a section.
//
// popNext() removes the head under the queue mutex, then, after releasing
// it, invokes every subscriber with (section_id, student_id) before
// returning. Subscribers therefore run on the popping thread, in
// registration order, and may call back into the queue without deadlock.
//
// Subscriber failures are isolated: an exception of any type thrown by one
// subscriber is caught, logged to stderr and skipped. The popped student stays popped
// and the remaining subscribers still run. A broken notification channel
// can never block promotion.
//
// Thread model:
//   All methods are safe to call from any thread. FIFO order is exact: a
//   single mutex serialises every enqueue and pop.
//
// Ownership:
//   Owned by RegistrarEngine. Holds copies of subscriber callbacks; the
//   INotificationSink overload captures the sink by reference, so the sink
//   must outlive its subscription.
// -----------------------------------------------------------------------------
class WaitlistQueue {
 public:
  using SeatAvailableCallback =
      std::function<void(const std::string& section_id,
                         const std::string& student_id)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  WaitlistQueue() = default;

  WaitlistQueue(const WaitlistQueue&) = delete;
  WaitlistQueue& operator=(const WaitlistQueue&) = delete;

  // -------------------------------------------------------------------------
  // enqueue(section_id, student_id)
  // -------------------------------------------------------------------------
  // Appends to the tail of the section's queue.
  // -------------------------------------------------------------------------
  void enqueue(const std::string& section_id, const std::string& student_id);

  // -------------------------------------------------------------------------
  // popNext(section_id)
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the student who has waited longest.
  //
  // @return The student id, or std::nullopt if the section has no queue or
  //         the queue is empty (no subscriber is invoked in that case).
  //
  // Side-effects: Invokes every subscriber once, synchronously, before
  //               returning.
  // -------------------------------------------------------------------------
  std::optional<std::string> popNext(const std::string& section_id);

  SubscriptionId subscribe(SeatAvailableCallback callback);

  // Registers `sink`. The sink must outlive the subscription.
  SubscriptionId subscribe(INotificationSink& sink);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // @return Number of students waiting for the section (0 if no queue).
  std::size_t size(const std::string& section_id) const;

  // @return Ordered copy of the section's queue, head first.
  std::vector<std::string> snapshot(const std::string& section_id) const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, SeatAvailableCallback>;

  void notify(const std::string& section_id, const std::string& student_id);

  mutable std::mutex queues_mutex_;
  std::unordered_map<std::string, std::deque<std::string>> queues_;

  std::mutex subscribers_mutex_;
  SubscriptionId next_subscription_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

}  // namespace seatwise
