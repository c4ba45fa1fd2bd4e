#pragma once

#include "seatwise/concurrent/seat_ledger.hpp"
#include "seatwise/validation/i_enrollment_validator.hpp"

namespace seatwise {

// -----------------------------------------------------------------------------
// CapacityValidator
// -----------------------------------------------------------------------------
//
// @brief  Returns SectionFull when the section's SeatPool has no free seat.
//
// @details
// This is a check, not a reservation. A request that passes here can still
// lose the seat in SeatPool::reserve(); EnrollmentCoordinator handles that
// reserve-race path by waitlisting as well.
// -----------------------------------------------------------------------------
class CapacityValidator : public IEnrollmentValidator {
 public:
  explicit CapacityValidator(SeatLedger& seats) : seats_(seats) {}

  ValidationOutcome validate(const domain::Student& student,
                             const domain::Section& section) const override;

  const char* name() const override { return "capacity"; }

 private:
  SeatLedger& seats_;
};

}  // namespace seatwise
