#include "seatwise/validation/time_conflict_validator.hpp"

namespace seatwise {

// Placeholder: no overlap rule is defined yet, so nothing is rejected.
// TODO: compare section.meeting against the meeting times of the student's
// Enrolled sections (enrollments_.findByStudent) once the overlap rule for
// back-to-back meetings is decided.
ValidationOutcome TimeConflictValidator::validate(
    const domain::Student& /*student*/,
    const domain::Section& /*section*/) const {
  return ValidationPassed{};
}

}  // namespace seatwise
