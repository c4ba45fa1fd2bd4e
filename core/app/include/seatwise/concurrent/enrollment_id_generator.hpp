#pragma once

#include "seatwise/domain/enrollment.hpp"

#include <atomic>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// EnrollmentIdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces "E1", "E2", ... from a single atomic counter shared by
//         every enroll() call, whichever section or thread it runs on.
//
// @details
// Uniqueness comes from fetch_add alone: the generator never looks at
// existing records. ID 0 is never produced; the first id is "E1".
//
// advancePast() exists for hydration: after restoring records that already
// carry ids up to "E<n>", the counter is moved to n + 1 so fresh ids never
// collide with restored ones. It only ever moves the counter forward.
//
// Thread model:
//   next_id() and advancePast() are safe to call concurrently from any
//   thread.
//
// Ownership:
//   Owned by RegistrarEngine as a value member and injected into
//   EnrollmentCoordinator by reference.
// -----------------------------------------------------------------------------
class EnrollmentIdGenerator {
 public:
  EnrollmentIdGenerator() = default;

  // Non-copyable, non-movable: two copies would hand out duplicate ids.
  EnrollmentIdGenerator(const EnrollmentIdGenerator&) = delete;
  EnrollmentIdGenerator& operator=(const EnrollmentIdGenerator&) = delete;
  EnrollmentIdGenerator(EnrollmentIdGenerator&&) = delete;
  EnrollmentIdGenerator& operator=(EnrollmentIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @return The next unique enrollment id ("E" + counter).
  //
  // Relaxed ordering is enough: the only requirement is a distinct value per
  // call. Record visibility is handled by the repository's own locking.
  // -------------------------------------------------------------------------
  domain::EnrollmentId next_id() {
    return "E" + std::to_string(next_.fetch_add(1, std::memory_order_relaxed));
  }

  // -------------------------------------------------------------------------
  // advancePast(n)
  // -------------------------------------------------------------------------
  // @brief  Guarantees every later next_id() returns a number > n.
  // -------------------------------------------------------------------------
  void advancePast(std::uint64_t n) {
    std::uint64_t current = next_.load(std::memory_order_relaxed);
    while (current <= n &&
           !next_.compare_exchange_weak(current, n + 1,
                                        std::memory_order_relaxed)) {
    }
  }

  // -------------------------------------------------------------------------
  // parseSequence(id)
  // -------------------------------------------------------------------------
  // @brief  Extracts n from "E<n>".
  // @return n, or 0 when id is not in that form.
  // @throws std::out_of_range when n is too large for advancePast() to move
  //         past it (n >= 2^64 - 1).
  // -------------------------------------------------------------------------
  static std::uint64_t parseSequence(const domain::EnrollmentId& id) {
    if (id.size() < 2 || id[0] != 'E') {
      return 0;
    }
    constexpr std::uint64_t kLimit = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (std::size_t i = 1; i < id.size(); ++i) {
      char c = id[i];
      if (c < '0' || c > '9') {
        return 0;
      }
      auto digit = static_cast<std::uint64_t>(c - '0');
      if (value > (kLimit - 1 - digit) / 10) {
        throw std::out_of_range("Enrollment id sequence out of range: " + id);
      }
      value = value * 10 + digit;
    }
    return value;
  }

 private:
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace seatwise
