#pragma once

#include "seatwise/repo/i_student_repository.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace seatwise {

// -----------------------------------------------------------------------------
// InMemoryStudentRepository
// -----------------------------------------------------------------------------
// Hash map guarded by a shared_mutex: concurrent lookups share the lock,
// saves take it exclusively. Lookups return copies so callers never hold a
// reference into the map.
// -----------------------------------------------------------------------------
class InMemoryStudentRepository : public IStudentRepository {
 public:
  std::optional<domain::Student> findStudent(
      const std::string& id) const override;
  void saveStudent(const domain::Student& student) override;
  std::vector<std::string> listStudentIds() const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Student> students_;
};

}  // namespace seatwise
