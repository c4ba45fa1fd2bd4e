#pragma once

#include <initializer_list>
#include <string_view>

namespace seatwise {
namespace domain {

// -----------------------------------------------------------------------------
// EnrollmentStatus: enrollment record lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an enrollment record can occupy for one
//         (student, section) pair.
//
// @details
// The lifecycle is small. EnrollmentCoordinator enforces the
// legal transition graph:
//
//   (none) ──> Enrolled ──> Dropped
//     │
//     └──────> Waitlisted      (superseded, never mutated, on promotion)
//
// Terminal state: Dropped. A later enroll attempt for the same pair creates
// a fresh record; a dropped record is never resurrected.
//
// A Waitlisted record stays Waitlisted after its student is promoted. The
// promotion writes a new Enrolled record with a new enrollment ID.
//
// Thread model:
//   Plain enum: a value type with no mutable state.
// -----------------------------------------------------------------------------
enum class EnrollmentStatus {
  Enrolled,    // Holds one seat in the section
  Waitlisted,  // Queued on the section's waitlist
  Dropped,     // Seat released: terminal state
};

// -----------------------------------------------------------------------------
// toString / parseEnrollmentStatus
// -----------------------------------------------------------------------------
// Wire names are upper case ("ENROLLED", "WAITLISTED", "DROPPED"); they are
// used by the JSON catalog and the IPC telemetry.
// -----------------------------------------------------------------------------
inline const char* toString(EnrollmentStatus s) {
  switch (s) {
    case EnrollmentStatus::Enrolled:   return "ENROLLED";
    case EnrollmentStatus::Waitlisted: return "WAITLISTED";
    case EnrollmentStatus::Dropped:    return "DROPPED";
  }
  return "UNKNOWN";
}

// Returns false (and leaves `out` untouched) for an unrecognised name.
inline bool parseEnrollmentStatus(std::string_view name, EnrollmentStatus& out) {
  for (EnrollmentStatus s : {EnrollmentStatus::Enrolled,
                             EnrollmentStatus::Waitlisted,
                             EnrollmentStatus::Dropped}) {
    if (name == toString(s)) {
      out = s;
      return true;
    }
  }
  return false;
}

}  // namespace domain
}  // namespace seatwise
