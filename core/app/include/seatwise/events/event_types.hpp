#pragma once

#include "seatwise/domain/enrollment.hpp"
#include "seatwise/domain/enrollment_status.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time attached to every event for auditing and ordering.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// EnrollmentUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports every enrollment record the coordinator writes:
// a new Enrolled or Waitlisted record (previous_status empty) or the
// Enrolled -> Dropped transition (previous_status == Enrolled).
// Why in architecture: observers (IPC telemetry, audit logs) follow the
// state machine without reading the repository.
// -----------------------------------------------------------------------------
struct EnrollmentUpdateEvent {
  domain::Enrollment enrollment;  // Snapshot after the write
  std::optional<domain::EnrollmentStatus> previous_status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// EnrollmentRejectedEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports an enroll request that changed nothing: an unknown
// student or section, or an eligibility failure. reason is the same text the
// caller receives.
// -----------------------------------------------------------------------------
struct EnrollmentRejectedEvent {
  std::string student_id;
  std::string section_id;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// SeatAvailableEvent
// -----------------------------------------------------------------------------
// Responsibility: A waitlisted student was popped because a seat opened in
// the section. Published just before the promotion attempt.
// -----------------------------------------------------------------------------
struct SeatAvailableEvent {
  std::string section_id;
  std::string student_id;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace seatwise
