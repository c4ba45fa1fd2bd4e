#pragma once

#include "seatwise/repo/i_enrollment_repository.hpp"
#include "seatwise/validation/i_enrollment_validator.hpp"

namespace seatwise {

// -----------------------------------------------------------------------------
// TimeConflictValidator: PLACEHOLDER, always passes
// -----------------------------------------------------------------------------
//
// @brief  Reserved for rejecting a section whose meeting time overlaps one of
//         the student's current enrollments.
//
// @details
// INCOMPLETE. validate() returns ValidationPassed unconditionally. The
// overlap rule has not been decided: whether touching intervals (10:00-11:00
// followed by 11:00-12:00) conflict, and whether waitlisted sections count
// as commitments. Until it is, this validator must not reject anything.
//
// The enrollment repository is already injected so the real check can look
// up the student's Enrolled records without changing how the chain is built.
// -----------------------------------------------------------------------------
class TimeConflictValidator : public IEnrollmentValidator {
 public:
  explicit TimeConflictValidator(const IEnrollmentRepository& enrollments)
      : enrollments_(enrollments) {}

  ValidationOutcome validate(const domain::Student& student,
                             const domain::Section& section) const override;

  const char* name() const override { return "time_conflict"; }

 private:
  const IEnrollmentRepository& enrollments_;
};

}  // namespace seatwise
