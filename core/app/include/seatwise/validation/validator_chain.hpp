#pragma once

#include "seatwise/concurrent/seat_ledger.hpp"
#include "seatwise/domain/enrollment_policy.hpp"
#include "seatwise/repo/i_course_repository.hpp"
#include "seatwise/repo/i_enrollment_repository.hpp"
#include "seatwise/validation/i_enrollment_validator.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// ValidatorChain: ordered eligibility checks
// -----------------------------------------------------------------------------
//
// @brief  Runs its validators in insertion order and returns the first
//         outcome that is not ValidationPassed.
//
// @details
// The chain short-circuits: validators after the first failure are not
// called. An empty chain passes everything.
//
// The order is significant only for which failure a caller sees first. In
// particular, whether a full section that the student is also ineligible
// for ends up as a waitlist entry (capacity first) or a rejection
// (prerequisite first) is decided here, by EnrollmentPolicy::validator_order.
//
// Thread model:
//   Built once at startup (add() is not thread-safe). validate() is
//   read-only and safe from any number of threads afterwards.
//
// Ownership:
//   Owns its validators.
// -----------------------------------------------------------------------------
class ValidatorChain {
 public:
  ValidatorChain() = default;

  ValidatorChain(const ValidatorChain&) = delete;
  ValidatorChain& operator=(const ValidatorChain&) = delete;
  ValidatorChain(ValidatorChain&&) = default;
  ValidatorChain& operator=(ValidatorChain&&) = default;

  // Appends a validator at the end of the chain.
  void add(std::unique_ptr<IEnrollmentValidator> validator);

  // -------------------------------------------------------------------------
  // validate(student, section)
  // -------------------------------------------------------------------------
  // @return The first non-passing outcome, or ValidationPassed.
  // -------------------------------------------------------------------------
  ValidationOutcome validate(const domain::Student& student,
                             const domain::Section& section) const;

  std::size_t size() const { return validators_.size(); }

  // @return Validator names in chain order.
  std::vector<std::string> names() const;

  // -------------------------------------------------------------------------
  // fromPolicy(policy, courses, enrollments, seats)
  // -------------------------------------------------------------------------
  // @brief  Builds the chain named by policy.validator_order.
  //
  // @throws std::invalid_argument on an unknown validator name.
  //
  // The referenced collaborators must outlive the returned chain.
  // -------------------------------------------------------------------------
  static ValidatorChain fromPolicy(const domain::EnrollmentPolicy& policy,
                                   const ICourseRepository& courses,
                                   const IEnrollmentRepository& enrollments,
                                   SeatLedger& seats);

  // @return true if fromPolicy() accepts `name`.
  static bool isKnown(const std::string& name);

 private:
  std::vector<std::unique_ptr<IEnrollmentValidator>> validators_;
};

}  // namespace seatwise
