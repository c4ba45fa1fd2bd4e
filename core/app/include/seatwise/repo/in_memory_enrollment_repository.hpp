#pragma once

#include "seatwise/repo/i_enrollment_repository.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace seatwise {

// -----------------------------------------------------------------------------
// InMemoryEnrollmentRepository
// -----------------------------------------------------------------------------
//
// @brief  Enrollment records keyed by id, behind a shared_mutex.
//
// @details
// Queries scan the whole map. The expected volume (one process, one term's
// registrations) keeps that cheap, and it avoids maintaining secondary
// indexes that would have to stay consistent with upserts.
//
// Results are sorted by the numeric part of the id so callers observe
// creation order.
// -----------------------------------------------------------------------------
class InMemoryEnrollmentRepository : public IEnrollmentRepository {
 public:
  void save(const domain::Enrollment& enrollment) override;

  std::vector<domain::Enrollment> findByStudent(
      const std::string& student_id) const override;
  std::vector<domain::Enrollment> findBySection(
      const std::string& section_id) const override;
  std::optional<domain::Enrollment> find(
      const domain::EnrollmentId& id) const override;

  std::vector<domain::Enrollment> findAll() const override;

 private:
  template <typename Predicate>
  std::vector<domain::Enrollment> collect(Predicate pred) const;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::EnrollmentId, domain::Enrollment> records_;
};

}  // namespace seatwise
