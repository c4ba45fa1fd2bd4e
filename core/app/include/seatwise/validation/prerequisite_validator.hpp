#pragma once

#include "seatwise/repo/i_course_repository.hpp"
#include "seatwise/validation/i_enrollment_validator.hpp"

namespace seatwise {

// -----------------------------------------------------------------------------
// PrerequisiteValidator
// -----------------------------------------------------------------------------
//
// @brief  Rejects a student who has not completed every prerequisite of the
//         section's course.
//
// @details
// Reasons:
//   "Course not found"              the section's course is not in the catalog
//   "Missing prerequisite: <id>"    first uncompleted prerequisite, in the
//                                   course's list order
// -----------------------------------------------------------------------------
class PrerequisiteValidator : public IEnrollmentValidator {
 public:
  explicit PrerequisiteValidator(const ICourseRepository& courses)
      : courses_(courses) {}

  ValidationOutcome validate(const domain::Student& student,
                             const domain::Section& section) const override;

  const char* name() const override { return "prerequisite"; }

 private:
  const ICourseRepository& courses_;
};

}  // namespace seatwise
