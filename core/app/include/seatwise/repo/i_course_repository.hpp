#pragma once

#include "seatwise/domain/course.hpp"
#include "seatwise/domain/section.hpp"

#include <optional>
#include <string>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// ICourseRepository: course and section catalog
// -----------------------------------------------------------------------------
//
// @brief  Lookup of sections (by EnrollmentCoordinator) and courses (by
//         PrerequisiteValidator), plus catalog maintenance used at startup.
//
// @details
// A Section value carries its immutable capacity but not its live seat
// count; occupancy lives in SeatLedger.
//
// Thread model: implementations must be safe for concurrent use.
// -----------------------------------------------------------------------------
class ICourseRepository {
 public:
  virtual ~ICourseRepository() = default;

  virtual std::optional<domain::Course> findCourse(
      const std::string& id) const = 0;
  virtual std::optional<domain::Section> findSection(
      const std::string& id) const = 0;

  virtual void saveCourse(const domain::Course& course) = 0;
  virtual void saveSection(const domain::Section& section) = 0;

  // @return All courses, sorted by id.
  virtual std::vector<domain::Course> listCourses() const = 0;

  // @return Sections of one course, sorted by section id.
  virtual std::vector<domain::Section> listSectionsForCourse(
      const std::string& course_id) const = 0;
};

}  // namespace seatwise
