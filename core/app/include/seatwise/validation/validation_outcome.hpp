#pragma once

#include <string>
#include <variant>

namespace seatwise {

// -----------------------------------------------------------------------------
// Validation outcome alternatives
// -----------------------------------------------------------------------------
//
// ValidationPassed    every check in the chain accepted the request.
// SectionFull         the section has no free seat. Not an error: the
//                     coordinator routes this to the waitlist.
// ValidationRejected  terminal rejection with a human-readable reason
//                     (missing prerequisite, unknown course, ...).
// -----------------------------------------------------------------------------
struct ValidationPassed {};

struct SectionFull {
  static constexpr const char* kReason = "Section is full";
};

struct ValidationRejected {
  std::string reason;
};

using ValidationOutcome =
    std::variant<ValidationPassed, SectionFull, ValidationRejected>;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
inline bool passed(const ValidationOutcome& outcome) {
  return std::holds_alternative<ValidationPassed>(outcome);
}

// Reason text for logs and result messages; "OK" when the outcome passed.
inline std::string reasonOf(const ValidationOutcome& outcome) {
  if (const auto* rejected = std::get_if<ValidationRejected>(&outcome)) {
    return rejected->reason;
  }
  if (std::holds_alternative<SectionFull>(outcome)) {
    return SectionFull::kReason;
  }
  return "OK";
}

}  // namespace seatwise
