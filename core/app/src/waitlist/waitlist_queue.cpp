#include "seatwise/waitlist/waitlist_queue.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace seatwise {

// -----------------------------------------------------------------------------
// enqueue
// -----------------------------------------------------------------------------
void WaitlistQueue::enqueue(const std::string& section_id,
                            const std::string& student_id) {
  std::lock_guard lock(queues_mutex_);
  // operator[] default-constructs the deque on first use.
  queues_[section_id].push_back(student_id);
}

// -----------------------------------------------------------------------------
// popNext: remove head under the lock, notify outside it
// -----------------------------------------------------------------------------
std::optional<std::string> WaitlistQueue::popNext(
    const std::string& section_id) {
  std::string student_id;
  {
    std::lock_guard lock(queues_mutex_);
    auto it = queues_.find(section_id);
    if (it == queues_.end() || it->second.empty()) {
      return std::nullopt;
    }
    student_id = std::move(it->second.front());
    it->second.pop_front();
  }

  notify(section_id, student_id);
  return student_id;
}

// -----------------------------------------------------------------------------
// subscribe / unsubscribe
// -----------------------------------------------------------------------------
WaitlistQueue::SubscriptionId WaitlistQueue::subscribe(
    SeatAvailableCallback callback) {
  std::lock_guard lock(subscribers_mutex_);
  SubscriptionId id = next_subscription_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

WaitlistQueue::SubscriptionId WaitlistQueue::subscribe(
    INotificationSink& sink) {
  return subscribe(
      [&sink](const std::string& section_id, const std::string& student_id) {
        sink.onSeatAvailable(section_id, student_id);
      });
}

void WaitlistQueue::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(subscribers_mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// size / snapshot
// -----------------------------------------------------------------------------
std::size_t WaitlistQueue::size(const std::string& section_id) const {
  std::lock_guard lock(queues_mutex_);
  auto it = queues_.find(section_id);
  return (it != queues_.end()) ? it->second.size() : 0;
}

std::vector<std::string> WaitlistQueue::snapshot(
    const std::string& section_id) const {
  std::lock_guard lock(queues_mutex_);
  auto it = queues_.find(section_id);
  if (it == queues_.end()) {
    return {};
  }
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

// -----------------------------------------------------------------------------
// notify: copy the subscriber list, then invoke each one in isolation
// -----------------------------------------------------------------------------
void WaitlistQueue::notify(const std::string& section_id,
                           const std::string& student_id) {
  std::vector<SubscriberEntry> copy;
  {
    std::lock_guard lock(subscribers_mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    try {
      callback(section_id, student_id);
    } catch (const std::exception& e) {
      std::cerr << "[WaitlistQueue] WARNING: subscriber " << id
                << " failed for section=" << section_id
                << " student=" << student_id << ": " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[WaitlistQueue] WARNING: subscriber " << id
                << " failed for section=" << section_id
                << " student=" << student_id << ": unknown exception\n";
    }
  }
}

}  // namespace seatwise
