#pragma once

#include "seatwise/concurrent/seat_pool.hpp"
#include "seatwise/domain/section.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// SeatSnapshot
// -----------------------------------------------------------------------------
// Point-in-time copy of one pool, for STATUS reporting.
// -----------------------------------------------------------------------------
struct SeatSnapshot {
  std::string section_id;
  int capacity{0};
  int enrolled{0};
};

// -----------------------------------------------------------------------------
// SeatLedger: sectionId → SeatPool registry
// -----------------------------------------------------------------------------
//
// @brief  Owns exactly one SeatPool per section and hands out stable
//         references to it.
//
// @details
// Pools are heap-allocated (unique_ptr) so a reference obtained from
// poolFor() stays valid while other threads register further sections and
// the map rehashes. Pools are never removed.
//
// The map itself is guarded by a shared_mutex: lookups take a shared lock,
// registration takes a unique lock. The seat counts inside each pool are
// NOT guarded by this mutex; they are atomics (see SeatPool).
//
// Thread model:
//   All methods are safe to call from any thread.
//
// Ownership:
//   Owned by RegistrarEngine. CapacityValidator and EnrollmentCoordinator
//   hold references.
// -----------------------------------------------------------------------------
class SeatLedger {
 public:
  SeatLedger() = default;

  SeatLedger(const SeatLedger&) = delete;
  SeatLedger& operator=(const SeatLedger&) = delete;

  // -------------------------------------------------------------------------
  // poolFor(section)
  // -------------------------------------------------------------------------
  // @brief  Returns the section's pool, creating it from section.capacity
  //         on first use.
  //
  // @details
  // When the pool already exists its capacity is left as is; capacity is
  // immutable after registration.
  //
  // @throws std::invalid_argument if a new pool would have negative capacity.
  // -------------------------------------------------------------------------
  SeatPool& poolFor(const domain::Section& section);

  // @return The pool for section_id, or nullptr if none was registered.
  SeatPool* find(const std::string& section_id) const;

  // @return One snapshot per registered pool, sorted by section id.
  std::vector<SeatSnapshot> snapshots() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<SeatPool>> pools_;
};

}  // namespace seatwise
