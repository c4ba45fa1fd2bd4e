#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// SeatPool: lock-free per-section seat counter
// -----------------------------------------------------------------------------
//
// @brief  Tracks how many seats of one section are taken and guarantees
//         0 <= enrolled <= capacity under any interleaving of concurrent
//         reserve() and release() calls.
//
// @details
// Both mutators are compare-and-retry loops on a single std::atomic<int>:
//
//   1. Load the current count.
//   2. Bail out if the move is illegal (full for reserve, empty for
//      release).
//   3. compare_exchange_weak(current, current +/- 1). If another thread
//      changed the count in between, `current` is refreshed and the loop
//      re-checks step 2 against the fresh value.
//
// Consequently, when N threads race for the last K open seats exactly K
// reserve() calls return true. No seat is ever counted twice and the
// counter never leaves [0, capacity].
//
// The only way to set the count directly is resetEnrolledCount(), reserved
// for hydration at startup (restoring state that already existed before
// the process started).
//
// Thread model:
//   All methods are safe to call concurrently from any thread. None of them
//   block.
//
// Ownership:
//   Owned by SeatLedger (one pool per section). Non-copyable and
//   non-movable: the atomic is the identity of the seat count.
// -----------------------------------------------------------------------------
class SeatPool {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  capacity  Number of seats. Must be >= 0.
  // @throws std::invalid_argument for a negative capacity.
  // -------------------------------------------------------------------------
  explicit SeatPool(int capacity) : capacity_(capacity) {
    if (capacity < 0) {
      throw std::invalid_argument("SeatPool capacity must be >= 0, got " +
                                  std::to_string(capacity));
    }
  }

  SeatPool(const SeatPool&) = delete;
  SeatPool& operator=(const SeatPool&) = delete;
  SeatPool(SeatPool&&) = delete;
  SeatPool& operator=(SeatPool&&) = delete;

  // -------------------------------------------------------------------------
  // reserve()
  // -------------------------------------------------------------------------
  // @brief  Takes one seat if one is free.
  //
  // @return true if a seat was taken; false if the pool was full at the
  //         moment of the attempt.
  //
  // Thread-safety: Lock-free; safe from any thread.
  // Side-effects:  Increments the count on success.
  // -------------------------------------------------------------------------
  bool reserve() {
    int current = enrolled_.load(std::memory_order_acquire);
    while (current < capacity_) {
      if (enrolled_.compare_exchange_weak(current, current + 1,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }

  // -------------------------------------------------------------------------
  // release()
  // -------------------------------------------------------------------------
  // @brief  Gives back one seat.
  //
  // @return false if the count was already zero (a second drop racing the
  //         first); true otherwise.
  //
  // Thread-safety: Lock-free; safe from any thread.
  // Side-effects:  Decrements the count on success.
  // -------------------------------------------------------------------------
  bool release() {
    int current = enrolled_.load(std::memory_order_acquire);
    while (current > 0) {
      if (enrolled_.compare_exchange_weak(current, current - 1,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }

  // -------------------------------------------------------------------------
  // resetEnrolledCount(count)
  // -------------------------------------------------------------------------
  // @brief  Administrative overwrite of the seat count.
  //
  // @details
  // **Hydration only.** Called by RegistrarEngine::start() while restoring
  // pre-existing enrollments, before any request can reach the pool. Not
  // part of normal admission control.
  //
  // @throws std::invalid_argument if count is outside [0, capacity].
  // -------------------------------------------------------------------------
  void resetEnrolledCount(int count) {
    if (count < 0 || count > capacity_) {
      throw std::invalid_argument(
          "SeatPool reset to " + std::to_string(count) +
          " outside [0, " + std::to_string(capacity_) + "]");
    }
    enrolled_.store(count, std::memory_order_release);
  }

  int enrolled() const { return enrolled_.load(std::memory_order_acquire); }
  int capacity() const { return capacity_; }
  int available() const { return capacity_ - enrolled(); }
  bool full() const { return enrolled() >= capacity_; }

 private:
  const int capacity_;
  std::atomic<int> enrolled_{0};
};

}  // namespace seatwise
