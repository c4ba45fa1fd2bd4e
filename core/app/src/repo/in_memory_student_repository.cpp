#include "seatwise/repo/in_memory_student_repository.hpp"

#include <algorithm>
#include <mutex>

namespace seatwise {

std::optional<domain::Student> InMemoryStudentRepository::findStudent(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = students_.find(id);
  if (it == students_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryStudentRepository::saveStudent(const domain::Student& student) {
  std::unique_lock lock(mutex_);
  students_[student.id] = student;
}

std::vector<std::string> InMemoryStudentRepository::listStudentIds() const {
  std::vector<std::string> ids;
  {
    std::shared_lock lock(mutex_);
    ids.reserve(students_.size());
    for (const auto& [id, student] : students_) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace seatwise
