#include "seatwise/repo/in_memory_course_repository.hpp"

#include <algorithm>
#include <mutex>

namespace seatwise {

std::optional<domain::Course> InMemoryCourseRepository::findCourse(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = courses_.find(id);
  if (it == courses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Section> InMemoryCourseRepository::findSection(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = sections_.find(id);
  if (it == sections_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryCourseRepository::saveCourse(const domain::Course& course) {
  std::unique_lock lock(mutex_);
  courses_[course.id] = course;
}

void InMemoryCourseRepository::saveSection(const domain::Section& section) {
  std::unique_lock lock(mutex_);
  sections_[section.id] = section;
}

std::vector<domain::Course> InMemoryCourseRepository::listCourses() const {
  std::vector<domain::Course> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(courses_.size());
    for (const auto& [id, course] : courses_) {
      result.push_back(course);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Course& a, const domain::Course& b) {
              return a.id < b.id;
            });
  return result;
}

std::vector<domain::Section> InMemoryCourseRepository::listSectionsForCourse(
    const std::string& course_id) const {
  std::vector<domain::Section> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, section] : sections_) {
      if (section.course_id == course_id) {
        result.push_back(section);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Section& a, const domain::Section& b) {
              return a.id < b.id;
            });
  return result;
}

}  // namespace seatwise
