#pragma once

#include "seatwise/domain/enrollment.hpp"

#include <optional>
#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// EnrollOutcome
// -----------------------------------------------------------------------------
// Enrolled    a seat was reserved; enrollment_id is the new Enrolled record.
// Waitlisted  no seat (full, or lost the reserve race); enrollment_id is
//             the new Waitlisted record. Not an error.
// Rejected    eligibility failure; nothing was written.
// NotFound    unknown student or section; nothing was written.
// -----------------------------------------------------------------------------
enum class EnrollOutcome {
  Enrolled,
  Waitlisted,
  Rejected,
  NotFound,
};

// -----------------------------------------------------------------------------
// EnrollResult
// -----------------------------------------------------------------------------
// message is the caller-facing text:
//   "Enrolled: E1"
//   "Added to waitlist: E2 Reason: Section is full"
//   "Added to waitlist (race): E2"
//   "Enrollment failed: Missing prerequisite: CS101"
//   "Student not found" / "Section not found"
// -----------------------------------------------------------------------------
struct EnrollResult {
  EnrollOutcome outcome{EnrollOutcome::Rejected};
  domain::EnrollmentId enrollment_id;  // Empty for Rejected / NotFound
  std::string reason;                  // Why not Enrolled; empty if Enrolled
  std::string message;
};

// -----------------------------------------------------------------------------
// DropOutcome / DropResult
// -----------------------------------------------------------------------------
// message:
//   "Dropped. Promoted: <promotion message>"
//   "Dropped. No waitlist promotions."
//   "No enrollment found to drop"
//
// DroppedAndPromoted means a waitlisted student was popped and a promotion
// was attempted; promotion->outcome tells whether it produced an Enrolled
// record.
// -----------------------------------------------------------------------------
enum class DropOutcome {
  Dropped,
  DroppedAndPromoted,
  NotFound,
};

struct DropResult {
  DropOutcome outcome{DropOutcome::NotFound};
  domain::EnrollmentId dropped_id;     // Empty for NotFound
  std::optional<std::string> promoted_student_id;
  std::optional<EnrollResult> promotion;
  std::string message;
};

inline const char* toString(EnrollOutcome o) {
  switch (o) {
    case EnrollOutcome::Enrolled:   return "Enrolled";
    case EnrollOutcome::Waitlisted: return "Waitlisted";
    case EnrollOutcome::Rejected:   return "Rejected";
    case EnrollOutcome::NotFound:   return "NotFound";
  }
  return "Unknown";
}

inline const char* toString(DropOutcome o) {
  switch (o) {
    case DropOutcome::Dropped:            return "Dropped";
    case DropOutcome::DroppedAndPromoted: return "DroppedAndPromoted";
    case DropOutcome::NotFound:           return "NotFound";
  }
  return "Unknown";
}

}  // namespace seatwise
