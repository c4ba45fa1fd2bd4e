#pragma once

#include <string>
#include <vector>

namespace seatwise {
namespace domain {

// -----------------------------------------------------------------------------
// Course
// -----------------------------------------------------------------------------
// Responsibility: Catalog entry shared by every section of the course.
// prerequisites is ordered: PrerequisiteValidator reports the first missing
// entry in list order.
// -----------------------------------------------------------------------------
struct Course {
  std::string id;
  std::string name;
  std::vector<std::string> prerequisites;
};

}  // namespace domain
}  // namespace seatwise
