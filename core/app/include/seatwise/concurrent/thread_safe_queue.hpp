#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Multi-producer, multi-consumer FIFO used at a thread
// boundary. Request threads push telemetry events; the IpcServer worker
// drains them between command polls.
//
// Optional bound: with max_size > 0 a push onto a full queue is refused and
// counted in rejected(). The items already queued are kept, so consumers
// see a gap-free prefix of what was produced. max_size == 0 means unbounded.
//
// Thread model: Every method is safe from any thread. pop() blocks until an
// item arrives; try_pop() and drain() never block.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t max_size = 0) : max_size_(max_size) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // @return false if the queue is bounded and full; `value` is discarded.
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (max_size_ != 0 && items_.size() >= max_size_) {
        ++rejected_;
        return false;
      }
      items_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  T pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty(); });
    return takeFrontLocked();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    return takeFrontLocked();
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // @return Every queued item in FIFO order, taken under one lock
  //         acquisition. Empty if nothing was queued.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(items_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t maxSize() const { return max_size_; }

  // Pushes refused because the queue was full, since construction.
  std::uint64_t rejected() const {
    std::lock_guard lock(mutex_);
    return rejected_;
  }

 private:
  T takeFrontLocked() {
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  const std::size_t max_size_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
  std::uint64_t rejected_{0};
};

}  // namespace seatwise
