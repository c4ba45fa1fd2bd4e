#pragma once

#include "seatwise/catalog/i_catalog_source.hpp"

#include <string>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// JsonCatalogSource
// -----------------------------------------------------------------------------
//
// @brief  ICatalogSource backed by a JSON document.
//
// @details
// Document shape (every array optional, defaults to empty):
//
//   {
//     "students": [
//       {"id": "S2", "name": "Bob", "email": "bob@example.edu",
//        "completed_courses": ["CS101"]}
//     ],
//     "courses": [
//       {"id": "CS102", "name": "Data Structures", "prerequisites": ["CS101"]}
//     ],
//     "sections": [
//       {"id": "SEC2", "course_id": "CS102", "instructor_id": "F2",
//        "capacity": 1,
//        "meeting": {"day": "Tuesday", "start": "11:00", "end": "12:00"}}
//     ],
//     "enrollments": [
//       {"id": "E1", "student_id": "S2", "section_id": "SEC2",
//        "status": "ENROLLED"}
//     ]
//   }
//
// The whole document is parsed and checked in the constructor; the
// accessors then return copies.
//
// Checks: required keys present with the right types, capacity >= 0,
// known weekday and status names, "HH:MM" times with start < end, every
// section's course exists, every enrollment's student and section exist,
// and ids are unique within each array.
//
// @throws std::runtime_error (from the constructor / fromFile) describing
//         the first problem found.
// -----------------------------------------------------------------------------
class JsonCatalogSource : public ICatalogSource {
 public:
  explicit JsonCatalogSource(const std::string& json_text);

  // Reads the document from `path`.
  static JsonCatalogSource fromFile(const std::string& path);

  std::vector<domain::Student> students() override { return students_; }
  std::vector<domain::Course> courses() override { return courses_; }
  std::vector<domain::Section> sections() override { return sections_; }
  std::vector<domain::Enrollment> enrollments() override {
    return enrollments_;
  }

 private:
  std::vector<domain::Student> students_;
  std::vector<domain::Course> courses_;
  std::vector<domain::Section> sections_;
  std::vector<domain::Enrollment> enrollments_;
};

}  // namespace seatwise
