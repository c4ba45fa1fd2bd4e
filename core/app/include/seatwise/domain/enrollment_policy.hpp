#pragma once

#include <string>
#include <vector>

namespace seatwise {
namespace domain {

// -----------------------------------------------------------------------------
// EnrollmentPolicy: engine-wide admission rules
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of admission parameters passed by value to
//         the components that need them during engine startup.
//
// @details
// validator_order lists the eligibility checks, by name, in the order the
// ValidatorChain runs them. Recognised names:
//
//   "prerequisite"   PrerequisiteValidator
//   "capacity"       CapacityValidator
//   "time_conflict"  TimeConflictValidator (placeholder, always passes)
//
// Order decides which failure reason a caller sees when several checks
// would fail. With the default order a student who lacks a prerequisite is
// rejected outright even when the section is also full; putting "capacity"
// first would instead send that student to the waitlist.
//
// Loaded from JSON by loadEngineConfig(); defaults apply when the key is
// absent.
//
// Thread model:
//   Plain data with value semantics. Copied into components at
//   construction time.
// -----------------------------------------------------------------------------
struct EnrollmentPolicy {
  std::vector<std::string> validator_order{"prerequisite", "capacity",
                                           "time_conflict"};
};

}  // namespace domain
}  // namespace seatwise
