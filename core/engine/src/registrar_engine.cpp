#include "seatwise/engine/registrar_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace seatwise {

namespace {

using nlohmann::json;

const std::string& requireString(const json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_string()) {
    throw std::invalid_argument(std::string("Missing or non-string field: ") +
                                key);
  }
  return it->get_ref<const std::string&>();
}

// "ENROLL S1 SEC1 admin" -> {"cmd":"ENROLL","student_id":"S1",
//                            "section_id":"SEC1","admin":true}
json parseWords(const std::string& text) {
  std::istringstream in(text);
  std::vector<std::string> words;
  for (std::string w; in >> w;) {
    words.push_back(std::move(w));
  }

  json request = json::object();
  if (words.empty()) {
    throw std::invalid_argument("Empty command");
  }
  request["cmd"] = words[0];
  if (words.size() > 1) {
    request["student_id"] = words[1];
  }
  if (words.size() > 2) {
    request["section_id"] = words[2];
  }
  if (words.size() > 3) {
    if (words[3] != "admin") {
      throw std::invalid_argument("Unexpected argument: " + words[3]);
    }
    request["admin"] = true;
  }
  if (words.size() > 4) {
    throw std::invalid_argument("Too many arguments");
  }
  return request;
}

json enrollmentToJson(const domain::Enrollment& e) {
  json j;
  j["id"] = e.id;
  j["student_id"] = e.student_id;
  j["section_id"] = e.section_id;
  j["status"] = domain::toString(e.status);
  return j;
}

json errorReply(const std::string& message) {
  json reply;
  reply["status"] = "error";
  reply["response"] = message;
  return reply;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the chain and the coordinator over the owned state
// -----------------------------------------------------------------------------
RegistrarEngine::RegistrarEngine(EngineConfig config)
    : config_(std::move(config)),
      validators_(ValidatorChain::fromPolicy(config_.policy, courses_,
                                             enrollments_, seats_)) {
  coordinator_ = std::make_unique<EnrollmentCoordinator>(
      students_, courses_, enrollments_, seats_, waitlist_, validators_, ids_,
      bus_);
}

RegistrarEngine::~RegistrarEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void RegistrarEngine::start(ICatalogSource* catalog) {
  if (running_) {
    return;
  }

  // ---  1) Hydration gate ------------------------------------------------------
  if (catalog != nullptr) {
    if (hydrated_) {
      std::cerr << "[RegistrarEngine] WARNING: catalog already loaded; "
                   "ignoring the one passed to start().\n";
    } else {
      hydrate(*catalog);
      hydrated_ = true;
    }
  }

  // ---  2) Console notifications -----------------------------------------------
  if (config_.console_notifications) {
    if (!console_sink_) {
      console_sink_ = std::make_unique<ConsoleNotificationSink>();
    }
    console_sub_id_ = waitlist_.subscribe(*console_sink_);
  }

  // ---  3) IpcServer and its telemetry bridge ----------------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    auto server = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    try {
      server->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[RegistrarEngine] IpcServer failed to start: " << e.what()
                << "\n";
      if (console_sub_id_) {
        waitlist_.unsubscribe(*console_sub_id_);
        console_sub_id_.reset();
      }
      throw;
    }
    ipc_server_ = server;
    // The bridge holds its own reference: a publish that copied the
    // subscriber list before stop() can still deliver to a live server.
    telemetry_sub_id_ = bus_.subscribe(
        [server](const Event& e) { server->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[RegistrarEngine] started. Validators:";
  for (const auto& name : validators_.names()) {
    std::cout << " " << name;
  }
  std::cout << ". IPC " << (ipc_server_ ? "enabled" : "disabled") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void RegistrarEngine::stop() {
  if (!running_) {
    return;
  }

  // Detach the bridge, then join the IPC thread here on the owning thread so
  // no command is in flight while we continue. A late delivery on another
  // thread only queues into the stopped server it still references.
  if (telemetry_sub_id_) {
    bus_.unsubscribe(*telemetry_sub_id_);
    telemetry_sub_id_.reset();
  }
  if (ipc_server_) {
    ipc_server_->stop();
    ipc_server_.reset();
  }

  if (console_sub_id_) {
    waitlist_.unsubscribe(*console_sub_id_);
    console_sub_id_.reset();
  }

  running_ = false;

  std::cout << "[RegistrarEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// hydrate(): load the catalog and rebuild seat counts and waitlists
// -----------------------------------------------------------------------------
void RegistrarEngine::hydrate(ICatalogSource& catalog) {
  auto students = catalog.students();
  auto courses = catalog.courses();
  auto sections = catalog.sections();
  auto records = catalog.enrollments();

  // Check every record before touching any state.
  std::map<std::string, int> live;
  std::map<std::string, int> capacity;
  for (const auto& section : sections) {
    if (section.capacity < 0) {
      throw std::invalid_argument("Section " + section.id +
                                  " has negative capacity");
    }
    capacity[section.id] = section.capacity;
  }
  std::uint64_t last_sequence = 0;
  for (const auto& record : records) {
    if (capacity.count(record.section_id) == 0) {
      throw std::runtime_error("Enrollment " + record.id +
                               " references unknown section: " +
                               record.section_id);
    }
    try {
      last_sequence = std::max(
          last_sequence, EnrollmentIdGenerator::parseSequence(record.id));
    } catch (const std::out_of_range& e) {
      throw std::runtime_error(e.what());
    }
    if (record.status == domain::EnrollmentStatus::Enrolled) {
      ++live[record.section_id];
    }
  }
  for (const auto& [section_id, count] : live) {
    if (count > capacity[section_id]) {
      throw std::runtime_error(
          "Section " + section_id + " has " + std::to_string(count) +
          " enrolled records but capacity " +
          std::to_string(capacity[section_id]));
    }
  }

  for (const auto& student : students) {
    students_.saveStudent(student);
  }
  for (const auto& course : courses) {
    courses_.saveCourse(course);
  }
  for (const auto& section : sections) {
    courses_.saveSection(section);
    seats_.poolFor(section).resetEnrolledCount(live[section.id]);
  }

  std::size_t waitlisted = 0;
  for (const auto& record : records) {
    enrollments_.save(record);
    if (record.status == domain::EnrollmentStatus::Waitlisted) {
      waitlist_.enqueue(record.section_id, record.student_id);
      ++waitlisted;
    }
  }
  ids_.advancePast(last_sequence);

  std::cout << "[RegistrarEngine] Catalog loaded: " << students.size()
            << " student(s), " << courses.size() << " course(s), "
            << sections.size() << " section(s), " << records.size()
            << " enrollment record(s), " << waitlisted
            << " waitlist entr" << (waitlisted == 1 ? "y" : "ies") << ".\n";
}

// -----------------------------------------------------------------------------
// enroll / drop
// -----------------------------------------------------------------------------
EnrollResult RegistrarEngine::enroll(const std::string& student_id,
                                     const std::string& section_id,
                                     bool admin_override) {
  return coordinator_->enroll(student_id, section_id, admin_override);
}

DropResult RegistrarEngine::drop(const std::string& student_id,
                                 const std::string& section_id) {
  return coordinator_->drop(student_id, section_id);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string RegistrarEngine::executeCommand(const std::string& cmd) {
  json response;

  try {
    json request;
    std::size_t first = cmd.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && cmd[first] == '{') {
      request = json::parse(cmd);
    } else {
      request = parseWords(cmd);
    }

    const std::string& name = requireString(request, "cmd");

    if (name == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (name == "ENROLL") {
      response = handleEnroll(request);
    } else if (name == "DROP") {
      response = handleDrop(request);
    } else if (name == "STATUS") {
      response = handleStatus();
    } else if (name == "ENROLLMENTS") {
      response = handleEnrollments(request);
    } else if (name == "CATALOG") {
      response = handleCatalog();
    } else {
      response = errorReply("Unknown command: " + name);
    }
  } catch (const json::exception& e) {
    std::cerr << "[RegistrarEngine] Rejected command: " << e.what() << "\n";
    response = errorReply(std::string("Malformed command: ") + e.what());
  } catch (const std::invalid_argument& e) {
    std::cerr << "[RegistrarEngine] Rejected command: " << e.what() << "\n";
    response = errorReply(e.what());
  }

  return response.dump();
}

json RegistrarEngine::handleEnroll(const json& args) {
  const std::string& student_id = requireString(args, "student_id");
  const std::string& section_id = requireString(args, "section_id");
  bool admin = false;
  auto admin_it = args.find("admin");
  if (admin_it != args.end() && !admin_it->is_null()) {
    if (!admin_it->is_boolean()) {
      throw std::invalid_argument("Field 'admin' must be a boolean");
    }
    admin = admin_it->get<bool>();
  }

  EnrollResult result = enroll(student_id, section_id, admin);

  json reply;
  reply["status"] = "ok";
  reply["result"] = result.message;
  reply["outcome"] = toString(result.outcome);
  if (result.enrollment_id.empty()) {
    reply["enrollment_id"] = nullptr;
  } else {
    reply["enrollment_id"] = result.enrollment_id;
  }
  return reply;
}

json RegistrarEngine::handleDrop(const json& args) {
  const std::string& student_id = requireString(args, "student_id");
  const std::string& section_id = requireString(args, "section_id");

  DropResult result = drop(student_id, section_id);

  json reply;
  reply["status"] = "ok";
  reply["result"] = result.message;
  reply["outcome"] = toString(result.outcome);
  reply["promoted"] = result.promotion.has_value() &&
                      result.promotion->outcome == EnrollOutcome::Enrolled;
  if (result.promoted_student_id) {
    reply["promoted_student_id"] = *result.promoted_student_id;
  } else {
    reply["promoted_student_id"] = nullptr;
  }
  return reply;
}

json RegistrarEngine::handleStatus() const {
  json sections = json::array();
  for (const auto& snapshot : seats_.snapshots()) {
    json s;
    s["section_id"] = snapshot.section_id;
    auto section = courses_.findSection(snapshot.section_id);
    s["course_id"] = section ? section->course_id : std::string();
    s["capacity"] = snapshot.capacity;
    s["enrolled"] = snapshot.enrolled;
    s["available"] = snapshot.capacity - snapshot.enrolled;
    s["waitlist"] = waitlist_.snapshot(snapshot.section_id);
    sections.push_back(std::move(s));
  }

  json reply;
  reply["status"] = "ok";
  reply["sections"] = std::move(sections);
  return reply;
}

json RegistrarEngine::handleEnrollments(const json& args) const {
  std::vector<domain::Enrollment> records;
  if (args.contains("student_id")) {
    records = enrollments_.findByStudent(requireString(args, "student_id"));
  } else if (args.contains("section_id")) {
    records = enrollments_.findBySection(requireString(args, "section_id"));
  } else {
    records = enrollments_.findAll();
  }

  json list = json::array();
  for (const auto& record : records) {
    list.push_back(enrollmentToJson(record));
  }

  json reply;
  reply["status"] = "ok";
  reply["enrollments"] = std::move(list);
  return reply;
}

json RegistrarEngine::handleCatalog() const {
  json courses = json::array();
  for (const auto& course : courses_.listCourses()) {
    json c;
    c["id"] = course.id;
    c["name"] = course.name;
    c["prerequisites"] = course.prerequisites;

    json sections = json::array();
    for (const auto& section : courses_.listSectionsForCourse(course.id)) {
      json s;
      s["id"] = section.id;
      s["instructor_id"] = section.instructor_id;
      s["capacity"] = section.capacity;
      s["day"] = domain::toString(section.meeting.day);
      s["start"] = domain::formatClock(section.meeting.start_minute);
      s["end"] = domain::formatClock(section.meeting.end_minute);
      sections.push_back(std::move(s));
    }
    c["sections"] = std::move(sections);
    courses.push_back(std::move(c));
  }

  json reply;
  reply["status"] = "ok";
  reply["courses"] = std::move(courses);
  return reply;
}

}  // namespace seatwise
