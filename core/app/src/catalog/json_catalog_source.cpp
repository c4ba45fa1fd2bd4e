#include "seatwise/catalog/json_catalog_source.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace seatwise {

namespace {

using nlohmann::json;

const json& arrayOrEmpty(const json& root, const char* key) {
  static const json kEmpty = json::array();
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_array()) {
    throw std::runtime_error(std::string("Catalog key '") + key +
                             "' must be an array");
  }
  return *it;
}

std::string optionalString(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

std::vector<std::string> optionalStringList(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return {};
  }
  return it->get<std::vector<std::string>>();
}

void requireUnique(std::set<std::string>& seen, const std::string& id,
                   const char* what) {
  if (id.empty()) {
    throw std::runtime_error(std::string("Catalog ") + what +
                             " with empty id");
  }
  if (!seen.insert(id).second) {
    throw std::runtime_error(std::string("Catalog has duplicate ") + what +
                             " id: " + id);
  }
}

domain::MeetingTime parseMeeting(const json& obj, const std::string& section_id) {
  domain::MeetingTime meeting;
  std::string day = obj.at("day").get<std::string>();
  if (!domain::parseWeekday(day, meeting.day)) {
    throw std::runtime_error("Section " + section_id +
                             " has unknown meeting day: " + day);
  }
  std::string start = obj.at("start").get<std::string>();
  std::string end = obj.at("end").get<std::string>();
  if (!domain::parseClock(start, meeting.start_minute) ||
      !domain::parseClock(end, meeting.end_minute)) {
    throw std::runtime_error("Section " + section_id +
                             " has a malformed meeting time (want HH:MM)");
  }
  if (meeting.start_minute >= meeting.end_minute) {
    throw std::runtime_error("Section " + section_id +
                             " meeting ends before it starts");
  }
  return meeting;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: parse and check the whole document up front
// -----------------------------------------------------------------------------
JsonCatalogSource::JsonCatalogSource(const std::string& json_text) {
  try {
    json root = json::parse(json_text);
    if (!root.is_object()) {
      throw std::runtime_error("Catalog root must be a JSON object");
    }

    std::set<std::string> student_ids;
    for (const auto& item : arrayOrEmpty(root, "students")) {
      domain::Student student;
      student.id = item.at("id").get<std::string>();
      student.name = item.at("name").get<std::string>();
      student.email = optionalString(item, "email");
      for (auto& course : optionalStringList(item, "completed_courses")) {
        student.completed_courses.insert(std::move(course));
      }
      requireUnique(student_ids, student.id, "student");
      students_.push_back(std::move(student));
    }

    std::set<std::string> course_ids;
    for (const auto& item : arrayOrEmpty(root, "courses")) {
      domain::Course course;
      course.id = item.at("id").get<std::string>();
      course.name = item.at("name").get<std::string>();
      course.prerequisites = optionalStringList(item, "prerequisites");
      requireUnique(course_ids, course.id, "course");
      courses_.push_back(std::move(course));
    }

    std::set<std::string> section_ids;
    for (const auto& item : arrayOrEmpty(root, "sections")) {
      domain::Section section;
      section.id = item.at("id").get<std::string>();
      section.course_id = item.at("course_id").get<std::string>();
      section.instructor_id = optionalString(item, "instructor_id");
      section.capacity = item.at("capacity").get<int>();
      if (section.capacity < 0) {
        throw std::runtime_error("Section " + section.id +
                                 " has negative capacity");
      }
      if (course_ids.count(section.course_id) == 0) {
        throw std::runtime_error("Section " + section.id +
                                 " references unknown course: " +
                                 section.course_id);
      }
      auto meeting_it = item.find("meeting");
      if (meeting_it != item.end() && !meeting_it->is_null()) {
        section.meeting = parseMeeting(*meeting_it, section.id);
      }
      requireUnique(section_ids, section.id, "section");
      sections_.push_back(std::move(section));
    }

    std::set<std::string> enrollment_ids;
    for (const auto& item : arrayOrEmpty(root, "enrollments")) {
      domain::Enrollment enrollment;
      enrollment.id = item.at("id").get<std::string>();
      enrollment.student_id = item.at("student_id").get<std::string>();
      enrollment.section_id = item.at("section_id").get<std::string>();
      std::string status = item.at("status").get<std::string>();
      if (!domain::parseEnrollmentStatus(status, enrollment.status)) {
        throw std::runtime_error("Enrollment " + enrollment.id +
                                 " has unknown status: " + status);
      }
      if (student_ids.count(enrollment.student_id) == 0) {
        throw std::runtime_error("Enrollment " + enrollment.id +
                                 " references unknown student: " +
                                 enrollment.student_id);
      }
      if (section_ids.count(enrollment.section_id) == 0) {
        throw std::runtime_error("Enrollment " + enrollment.id +
                                 " references unknown section: " +
                                 enrollment.section_id);
      }
      requireUnique(enrollment_ids, enrollment.id, "enrollment");
      enrollments_.push_back(std::move(enrollment));
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("Catalog JSON error: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// fromFile
// -----------------------------------------------------------------------------
JsonCatalogSource JsonCatalogSource::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open catalog file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return JsonCatalogSource(buffer.str());
}

}  // namespace seatwise
