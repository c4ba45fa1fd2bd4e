#include "seatwise/concurrent/seat_ledger.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace seatwise {

// -----------------------------------------------------------------------------
// poolFor: shared-lock fast path, unique-lock registration
// -----------------------------------------------------------------------------
SeatPool& SeatLedger::poolFor(const domain::Section& section) {
  {
    std::shared_lock lock(mutex_);
    auto it = pools_.find(section.id);
    if (it != pools_.end()) {
      return *it->second;
    }
  }

  std::unique_lock lock(mutex_);
  // Another thread may have registered the same section between the two
  // locks; the first pool wins.
  auto it = pools_.find(section.id);
  if (it != pools_.end()) {
    return *it->second;
  }
  auto pool = std::make_unique<SeatPool>(section.capacity);
  SeatPool& ref = *pool;
  pools_.emplace(section.id, std::move(pool));
  return ref;
}

// -----------------------------------------------------------------------------
// find
// -----------------------------------------------------------------------------
SeatPool* SeatLedger::find(const std::string& section_id) const {
  std::shared_lock lock(mutex_);
  auto it = pools_.find(section_id);
  return (it != pools_.end()) ? it->second.get() : nullptr;
}

// -----------------------------------------------------------------------------
// snapshots
// -----------------------------------------------------------------------------
std::vector<SeatSnapshot> SeatLedger::snapshots() const {
  std::vector<SeatSnapshot> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(pools_.size());
    for (const auto& [id, pool] : pools_) {
      result.push_back(SeatSnapshot{id, pool->capacity(), pool->enrolled()});
    }
  }
  std::sort(result.begin(), result.end(),
            [](const SeatSnapshot& a, const SeatSnapshot& b) {
              return a.section_id < b.section_id;
            });
  return result;
}

}  // namespace seatwise
