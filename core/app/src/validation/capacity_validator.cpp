#include "seatwise/validation/capacity_validator.hpp"

namespace seatwise {

ValidationOutcome CapacityValidator::validate(
    const domain::Student& /*student*/, const domain::Section& section) const {
  if (seats_.poolFor(section).full()) {
    return SectionFull{};
  }
  return ValidationPassed{};
}

}  // namespace seatwise
