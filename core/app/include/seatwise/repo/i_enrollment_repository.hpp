#pragma once

#include "seatwise/domain/enrollment.hpp"

#include <optional>
#include <string>
#include <vector>

namespace seatwise {

// -----------------------------------------------------------------------------
// IEnrollmentRepository: the enrollment record store
// -----------------------------------------------------------------------------
//
// @brief  Exclusive owner of enrollment records. EnrollmentCoordinator
//         writes through save() and never keeps records beyond one request.
//
// @details
// save() is an upsert keyed by Enrollment::id: transitioning a record to
// Dropped is done by saving a modified copy.
//
// Query results are returned in ascending enrollment-sequence order
// (E1, E2, ..., E10), i.e. creation order.
//
// Thread model: implementations must be safe for concurrent use.
// -----------------------------------------------------------------------------
class IEnrollmentRepository {
 public:
  virtual ~IEnrollmentRepository() = default;

  virtual void save(const domain::Enrollment& enrollment) = 0;

  virtual std::vector<domain::Enrollment> findByStudent(
      const std::string& student_id) const = 0;
  virtual std::vector<domain::Enrollment> findBySection(
      const std::string& section_id) const = 0;
  virtual std::optional<domain::Enrollment> find(
      const domain::EnrollmentId& id) const = 0;

  virtual std::vector<domain::Enrollment> findAll() const = 0;
};

}  // namespace seatwise
