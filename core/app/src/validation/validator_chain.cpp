#include "seatwise/validation/validator_chain.hpp"
#include "seatwise/validation/capacity_validator.hpp"
#include "seatwise/validation/prerequisite_validator.hpp"
#include "seatwise/validation/time_conflict_validator.hpp"

#include <stdexcept>
#include <utility>

namespace seatwise {

namespace {
constexpr const char* kKnownValidators[] = {"prerequisite", "capacity",
                                            "time_conflict"};
}  // namespace

// -----------------------------------------------------------------------------
// add
// -----------------------------------------------------------------------------
void ValidatorChain::add(std::unique_ptr<IEnrollmentValidator> validator) {
  validators_.push_back(std::move(validator));
}

// -----------------------------------------------------------------------------
// validate: first non-passing outcome wins
// -----------------------------------------------------------------------------
ValidationOutcome ValidatorChain::validate(
    const domain::Student& student, const domain::Section& section) const {
  for (const auto& validator : validators_) {
    ValidationOutcome outcome = validator->validate(student, section);
    if (!passed(outcome)) {
      return outcome;
    }
  }
  return ValidationPassed{};
}

// -----------------------------------------------------------------------------
// names
// -----------------------------------------------------------------------------
std::vector<std::string> ValidatorChain::names() const {
  std::vector<std::string> result;
  result.reserve(validators_.size());
  for (const auto& validator : validators_) {
    result.emplace_back(validator->name());
  }
  return result;
}

// -----------------------------------------------------------------------------
// fromPolicy: map configured names to validator instances
// -----------------------------------------------------------------------------
ValidatorChain ValidatorChain::fromPolicy(
    const domain::EnrollmentPolicy& policy, const ICourseRepository& courses,
    const IEnrollmentRepository& enrollments, SeatLedger& seats) {
  ValidatorChain chain;
  for (const auto& name : policy.validator_order) {
    if (name == "prerequisite") {
      chain.add(std::make_unique<PrerequisiteValidator>(courses));
    } else if (name == "capacity") {
      chain.add(std::make_unique<CapacityValidator>(seats));
    } else if (name == "time_conflict") {
      chain.add(std::make_unique<TimeConflictValidator>(enrollments));
    } else {
      throw std::invalid_argument("Unknown validator: " + name);
    }
  }
  return chain;
}

// -----------------------------------------------------------------------------
// isKnown
// -----------------------------------------------------------------------------
bool ValidatorChain::isKnown(const std::string& name) {
  for (const char* known : kKnownValidators) {
    if (name == known) {
      return true;
    }
  }
  return false;
}

}  // namespace seatwise
