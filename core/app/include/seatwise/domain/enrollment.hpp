#pragma once

#include "seatwise/domain/enrollment_status.hpp"

#include <string>

namespace seatwise {
namespace domain {

// -----------------------------------------------------------------------------
// EnrollmentId
// -----------------------------------------------------------------------------
// Responsibility: Unique identifier of one enrollment record, rendered as
// "E<n>" where n comes from EnrollmentIdGenerator.
// Hydrated records arrive already rendered.
// -----------------------------------------------------------------------------
using EnrollmentId = std::string;

// -----------------------------------------------------------------------------
// Enrollment
// -----------------------------------------------------------------------------
// Responsibility: One enrollment record: who, where, and in which lifecycle
// state.
//
// @details
// Created by EnrollmentCoordinator in Enrolled or Waitlisted state. The
// authoritative copy lives in the IEnrollmentRepository; the coordinator
// only holds a copy for the duration of one request. Copies published in
// EnrollmentUpdateEvent are snapshots.
// -----------------------------------------------------------------------------
struct Enrollment {
  EnrollmentId id;          // "E1", "E2", ...
  std::string student_id;
  std::string section_id;
  EnrollmentStatus status{EnrollmentStatus::Enrolled};
};

}  // namespace domain
}  // namespace seatwise
