#pragma once

#include "seatwise/domain/student.hpp"

#include <optional>
#include <string>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// IStudentRepository: student lookup consumed by the admission core
// -----------------------------------------------------------------------------
//
// @brief  Read access to students, plus the save/list helpers the catalog
//         hydration and the command surface need.
//
// @details
// The core only calls findStudent(). Implementations must be safe to call
// from every request thread concurrently.
// -----------------------------------------------------------------------------
class IStudentRepository {
 public:
  virtual ~IStudentRepository() = default;

  // @return A copy of the student, or std::nullopt if the id is unknown.
  virtual std::optional<domain::Student> findStudent(
      const std::string& id) const = 0;

  // Inserts or replaces the student with the same id.
  virtual void saveStudent(const domain::Student& student) = 0;

  // @return All student ids, sorted.
  virtual std::vector<std::string> listStudentIds() const = 0;
};

}  // namespace seatwise
