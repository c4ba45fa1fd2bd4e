#pragma once

#include <set>
#include <string>

namespace seatwise {
namespace domain {

// -----------------------------------------------------------------------------
// Student
// -----------------------------------------------------------------------------
// Responsibility: The enrolling party. completed_courses is the only field
// the admission core reads (prerequisite checks); name and email are carried
// for the catalog and command surface.
// -----------------------------------------------------------------------------
struct Student {
  std::string id;
  std::string name;
  std::string email;
  std::set<std::string> completed_courses;

  bool hasCompleted(const std::string& course_id) const {
    return completed_courses.count(course_id) != 0;
  }
};

}  // namespace domain
}  // namespace seatwise
