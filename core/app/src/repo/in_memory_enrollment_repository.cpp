#include "seatwise/repo/in_memory_enrollment_repository.hpp"
#include "seatwise/concurrent/enrollment_id_generator.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace seatwise {

namespace {

// Ids past the generator's range sort after every numbered id.
std::uint64_t sequenceKey(const domain::EnrollmentId& id) {
  try {
    return EnrollmentIdGenerator::parseSequence(id);
  } catch (const std::out_of_range&) {
    return std::numeric_limits<std::uint64_t>::max();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// save: upsert by id
// -----------------------------------------------------------------------------
void InMemoryEnrollmentRepository::save(const domain::Enrollment& enrollment) {
  std::unique_lock lock(mutex_);
  records_[enrollment.id] = enrollment;
}

// -----------------------------------------------------------------------------
// collect: copy matching records under the shared lock, then sort outside it
// -----------------------------------------------------------------------------
template <typename Predicate>
std::vector<domain::Enrollment> InMemoryEnrollmentRepository::collect(
    Predicate pred) const {
  std::vector<domain::Enrollment> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, record] : records_) {
      if (pred(record)) {
        result.push_back(record);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Enrollment& a, const domain::Enrollment& b) {
              auto sa = sequenceKey(a.id);
              auto sb = sequenceKey(b.id);
              return sa != sb ? sa < sb : a.id < b.id;
            });
  return result;
}

std::vector<domain::Enrollment> InMemoryEnrollmentRepository::findByStudent(
    const std::string& student_id) const {
  return collect([&student_id](const domain::Enrollment& e) {
    return e.student_id == student_id;
  });
}

std::vector<domain::Enrollment> InMemoryEnrollmentRepository::findBySection(
    const std::string& section_id) const {
  return collect([&section_id](const domain::Enrollment& e) {
    return e.section_id == section_id;
  });
}

std::optional<domain::Enrollment> InMemoryEnrollmentRepository::find(
    const domain::EnrollmentId& id) const {
  std::shared_lock lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Enrollment> InMemoryEnrollmentRepository::findAll() const {
  return collect([](const domain::Enrollment&) { return true; });
}

}  // namespace seatwise
