#pragma once

#include "seatwise/domain/section.hpp"
#include "seatwise/domain/student.hpp"
#include "seatwise/validation/validation_outcome.hpp"

namespace seatwise {

// -----------------------------------------------------------------------------
// IEnrollmentValidator: one eligibility rule
// -----------------------------------------------------------------------------
//
// @brief  Decides whether `student` may take a seat in `section` according
//         to a single rule.
//
// @details
// Validators are independent of one another: none reads another's result
// and none keeps per-request state, so a ValidatorChain can run them in any
// configured order. They may read shared collaborators (repositories, the
// seat ledger) through references fixed at construction.
//
// Thread model:
//   validate() is called concurrently from every request thread.
//   Implementations must be safe for that (they are read-only).
// -----------------------------------------------------------------------------
class IEnrollmentValidator {
 public:
  virtual ~IEnrollmentValidator() = default;

  virtual ValidationOutcome validate(const domain::Student& student,
                                     const domain::Section& section) const = 0;

  // Configuration name ("capacity", "prerequisite", ...), used in logs.
  virtual const char* name() const = 0;
};

}  // namespace seatwise
