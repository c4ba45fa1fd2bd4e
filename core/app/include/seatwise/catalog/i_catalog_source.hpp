#pragma once

#include "seatwise/domain/course.hpp"
#include "seatwise/domain/enrollment.hpp"
#include "seatwise/domain/section.hpp"
#include "seatwise/domain/student.hpp"

#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// ICatalogSource: startup catalog and enrollment state
// -----------------------------------------------------------------------------
//
// @brief  Supplies the students, courses, sections and pre-existing
//         enrollment records that the engine loads before it accepts any
//         request.
//
// @details
// RegistrarEngine::start() calls each method exactly once and hydrates the
// repositories, SeatLedger, WaitlistQueue and EnrollmentIdGenerator from
// the results:
//
//   - Every section gets a SeatPool sized by its capacity.
//   - Enrolled records set the pool's count (administrative reset).
//   - Waitlisted records are re-enqueued in the order returned here, so the
//     returned order IS the restored FIFO order.
//   - The id generator is advanced past the largest "E<n>" returned.
//
// The engine does not re-run validation on hydrated records; the source is
// authoritative.
//
// Calling convention:
//   Main thread only, before the IpcServer starts. Not thread-safe.
//
// Ownership:
//   RegistrarEngine receives a non-owning pointer in start() and does not
//   keep it.
// -----------------------------------------------------------------------------
class ICatalogSource {
 public:
  virtual ~ICatalogSource() = default;

  virtual std::vector<domain::Student> students() = 0;
  virtual std::vector<domain::Course> courses() = 0;
  virtual std::vector<domain::Section> sections() = 0;

  // Records in the order they were created.
  virtual std::vector<domain::Enrollment> enrollments() = 0;
};

// -----------------------------------------------------------------------------
// SampleCatalogSource: built-in demo catalog
// -----------------------------------------------------------------------------
//
// @brief  Two students, two courses and one section per course; no
//         existing enrollments.
//
//   Students:  S1 Alice
//              S2 Bob (completed CS101)
//   Courses:   CS101 "Intro CS"
//              CS102 "Data Structures" (requires CS101)
//   Sections:  SEC1  CS101, instructor F1, capacity 2, Monday 09:00-10:00
//              SEC2  CS102, instructor F2, capacity 1, Tuesday 11:00-12:00
//
// Used by main() when no catalog_path is configured, and by tests.
// -----------------------------------------------------------------------------
class SampleCatalogSource : public ICatalogSource {
 public:
  std::vector<domain::Student> students() override {
    domain::Student alice;
    alice.id = "S1";
    alice.name = "Alice";
    alice.email = "alice@example.edu";

    domain::Student bob;
    bob.id = "S2";
    bob.name = "Bob";
    bob.email = "bob@example.edu";
    bob.completed_courses.insert("CS101");

    return {alice, bob};
  }

  std::vector<domain::Course> courses() override {
    domain::Course intro;
    intro.id = "CS101";
    intro.name = "Intro CS";

    domain::Course data_structures;
    data_structures.id = "CS102";
    data_structures.name = "Data Structures";
    data_structures.prerequisites.push_back("CS101");

    return {intro, data_structures};
  }

  std::vector<domain::Section> sections() override {
    domain::Section sec1;
    sec1.id = "SEC1";
    sec1.course_id = "CS101";
    sec1.instructor_id = "F1";
    sec1.capacity = 2;
    sec1.meeting = {domain::Weekday::Monday, 9 * 60, 10 * 60};

    domain::Section sec2;
    sec2.id = "SEC2";
    sec2.course_id = "CS102";
    sec2.instructor_id = "F2";
    sec2.capacity = 1;
    sec2.meeting = {domain::Weekday::Tuesday, 11 * 60, 12 * 60};

    return {sec1, sec2};
  }

  std::vector<domain::Enrollment> enrollments() override { return {}; }
};

}  // namespace seatwise
