#include "seatwise/validation/prerequisite_validator.hpp"

namespace seatwise {

ValidationOutcome PrerequisiteValidator::validate(
    const domain::Student& student, const domain::Section& section) const {
  auto course = courses_.findCourse(section.course_id);
  if (!course.has_value()) {
    return ValidationRejected{"Course not found"};
  }

  for (const auto& prerequisite : course->prerequisites) {
    if (!student.hasCompleted(prerequisite)) {
      return ValidationRejected{"Missing prerequisite: " + prerequisite};
    }
  }
  return ValidationPassed{};
}

}  // namespace seatwise
