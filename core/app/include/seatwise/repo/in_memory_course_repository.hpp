#pragma once

#include "seatwise/repo/i_course_repository.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace seatwise {

// -----------------------------------------------------------------------------
// InMemoryCourseRepository
// -----------------------------------------------------------------------------
// Two hash maps (courses, sections) behind one shared_mutex. Listing calls
// copy and sort under the shared lock.
// -----------------------------------------------------------------------------
class InMemoryCourseRepository : public ICourseRepository {
 public:
  std::optional<domain::Course> findCourse(
      const std::string& id) const override;
  std::optional<domain::Section> findSection(
      const std::string& id) const override;

  void saveCourse(const domain::Course& course) override;
  void saveSection(const domain::Section& section) override;

  std::vector<domain::Course> listCourses() const override;
  std::vector<domain::Section> listSectionsForCourse(
      const std::string& course_id) const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Course> courses_;
  std::unordered_map<std::string, domain::Section> sections_;
};

}  // namespace seatwise
