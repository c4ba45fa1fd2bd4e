#include "seatwise/enrollment/enrollment_coordinator.hpp"

#include <chrono>
#include <iostream>
#include <variant>

namespace seatwise {

// -----------------------------------------------------------------------------
// Constructor: republish every waitlist pop as a SeatAvailableEvent
// -----------------------------------------------------------------------------
EnrollmentCoordinator::EnrollmentCoordinator(
    const IStudentRepository& students, const ICourseRepository& courses,
    IEnrollmentRepository& enrollments, SeatLedger& seats,
    WaitlistQueue& waitlist, const ValidatorChain& validators,
    EnrollmentIdGenerator& ids, EventBus& bus)
    : students_(students),
      courses_(courses),
      enrollments_(enrollments),
      seats_(seats),
      waitlist_(waitlist),
      validators_(validators),
      ids_(ids),
      bus_(bus) {
  waitlist_sub_id_ = waitlist_.subscribe(
      [this](const std::string& section_id, const std::string& student_id) {
        SeatAvailableEvent event;
        event.section_id = section_id;
        event.student_id = student_id;
        event.timestamp = std::chrono::system_clock::now();
        event.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);
        bus_.publish(event);
      });
}

EnrollmentCoordinator::~EnrollmentCoordinator() {
  waitlist_.unsubscribe(waitlist_sub_id_);
}

// -----------------------------------------------------------------------------
// enroll: resolve ids outside the lock, admit under the section lock
// -----------------------------------------------------------------------------
EnrollResult EnrollmentCoordinator::enroll(const std::string& student_id,
                                           const std::string& section_id,
                                           bool admin_override) {
  std::optional<domain::Student> student = students_.findStudent(student_id);
  if (!student) {
    return reject(EnrollOutcome::NotFound, student_id, section_id,
                  "Student not found", "Student not found");
  }

  std::optional<domain::Section> section = courses_.findSection(section_id);
  if (!section) {
    return reject(EnrollOutcome::NotFound, student_id, section_id,
                  "Section not found", "Section not found");
  }

  std::lock_guard lock(sectionMutex(section_id));
  return admitLocked(*student, *section, admin_override);
}

// -----------------------------------------------------------------------------
// drop: Enrolled -> Dropped, release, then promote the waitlist head
// -----------------------------------------------------------------------------
DropResult EnrollmentCoordinator::drop(const std::string& student_id,
                                       const std::string& section_id) {
  DropResult result;

  // A section that was never registered cannot hold an Enrolled record.
  std::optional<domain::Section> section = courses_.findSection(section_id);
  if (!section) {
    result.message = "No enrollment found to drop";
    return result;
  }

  std::lock_guard lock(sectionMutex(section_id));

  // Oldest Enrolled record first: findByStudent is ordered by id sequence.
  std::optional<domain::Enrollment> target;
  for (const auto& e : enrollments_.findByStudent(student_id)) {
    if (e.section_id == section_id &&
        e.status == domain::EnrollmentStatus::Enrolled) {
      target = e;
      break;
    }
  }

  if (!target) {
    result.message = "No enrollment found to drop";
    return result;
  }

  target->status = domain::EnrollmentStatus::Dropped;
  enrollments_.save(*target);
  publishUpdate(*target, domain::EnrollmentStatus::Enrolled);

  if (!seats_.poolFor(*section).release()) {
    std::cerr << "[EnrollmentCoordinator] WARNING: release() on empty pool "
                 "for section=" << section_id << " after dropping "
              << target->id << ". Seat count is out of step with records.\n";
  }

  result.dropped_id = target->id;

  std::optional<std::string> next = waitlist_.popNext(section_id);
  if (!next) {
    result.outcome = DropOutcome::Dropped;
    result.message = "Dropped. No waitlist promotions.";
    return result;
  }

  EnrollResult promotion;
  std::optional<domain::Student> promoted = students_.findStudent(*next);
  if (promoted) {
    promotion = admitLocked(*promoted, *section, /*admin_override=*/true);
  } else {
    promotion = reject(EnrollOutcome::NotFound, *next, section_id,
                       "Student not found", "Student not found");
  }

  result.outcome = DropOutcome::DroppedAndPromoted;
  result.promoted_student_id = *next;
  result.message = "Dropped. Promoted: " + promotion.message;
  result.promotion = std::move(promotion);
  return result;
}

// -----------------------------------------------------------------------------
// admitLocked: validation (unless overridden), then reserve
// -----------------------------------------------------------------------------
EnrollResult EnrollmentCoordinator::admitLocked(const domain::Student& student,
                                                const domain::Section& section,
                                                bool admin_override) {
  if (!admin_override) {
    ValidationOutcome outcome = validators_.validate(student, section);

    if (std::holds_alternative<SectionFull>(outcome)) {
      return waitlistLocked(student, section, "Added to waitlist: ",
                            /*append_reason=*/true);
    }

    if (const auto* rejected = std::get_if<ValidationRejected>(&outcome)) {
      return reject(EnrollOutcome::Rejected, student.id, section.id,
                    rejected->reason,
                    "Enrollment failed: " + rejected->reason);
    }
  }

  if (!seats_.poolFor(section).reserve()) {
    std::cout << "[EnrollmentCoordinator] Reserve lost for student="
              << student.id << " section=" << section.id
              << "; waitlisting.\n";
    return waitlistLocked(student, section, "Added to waitlist (race): ",
                          /*append_reason=*/false);
  }

  domain::Enrollment enrollment =
      record(student, section, domain::EnrollmentStatus::Enrolled);
  enrollments_.save(enrollment);
  publishUpdate(enrollment, std::nullopt);

  EnrollResult result;
  result.outcome = EnrollOutcome::Enrolled;
  result.enrollment_id = enrollment.id;
  result.message = "Enrolled: " + enrollment.id;
  return result;
}

// -----------------------------------------------------------------------------
// waitlistLocked: Waitlisted record plus queue entry
// -----------------------------------------------------------------------------
EnrollResult EnrollmentCoordinator::waitlistLocked(
    const domain::Student& student, const domain::Section& section,
    const std::string& message_prefix, bool append_reason) {
  domain::Enrollment enrollment =
      record(student, section, domain::EnrollmentStatus::Waitlisted);
  enrollments_.save(enrollment);
  waitlist_.enqueue(section.id, student.id);
  publishUpdate(enrollment, std::nullopt);

  EnrollResult result;
  result.outcome = EnrollOutcome::Waitlisted;
  result.enrollment_id = enrollment.id;
  result.reason = SectionFull::kReason;
  result.message = message_prefix + enrollment.id;
  if (append_reason) {
    result.message += " Reason: " + result.reason;
  }
  return result;
}

// -----------------------------------------------------------------------------
// reject
// -----------------------------------------------------------------------------
EnrollResult EnrollmentCoordinator::reject(EnrollOutcome outcome,
                                           const std::string& student_id,
                                           const std::string& section_id,
                                           const std::string& reason,
                                           const std::string& message) {
  EnrollmentRejectedEvent event;
  event.student_id = student_id;
  event.section_id = section_id;
  event.reason = reason;
  event.timestamp = std::chrono::system_clock::now();
  event.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);
  bus_.publish(event);

  EnrollResult result;
  result.outcome = outcome;
  result.reason = reason;
  result.message = message;
  return result;
}

// -----------------------------------------------------------------------------
// record: new enrollment with a fresh id
// -----------------------------------------------------------------------------
domain::Enrollment EnrollmentCoordinator::record(
    const domain::Student& student, const domain::Section& section,
    domain::EnrollmentStatus status) {
  domain::Enrollment enrollment;
  enrollment.id = ids_.next_id();
  enrollment.student_id = student.id;
  enrollment.section_id = section.id;
  enrollment.status = status;
  return enrollment;
}

void EnrollmentCoordinator::publishUpdate(
    const domain::Enrollment& enrollment,
    std::optional<domain::EnrollmentStatus> previous) {
  EnrollmentUpdateEvent event;
  event.enrollment = enrollment;
  event.previous_status = previous;
  event.timestamp = std::chrono::system_clock::now();
  event.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// sectionMutex: find-or-create; entries are never erased, so the returned
// reference stays valid after registry_mutex_ is released.
// -----------------------------------------------------------------------------
std::mutex& EnrollmentCoordinator::sectionMutex(const std::string& section_id) {
  std::lock_guard lock(registry_mutex_);
  auto& slot = section_mutexes_[section_id];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

}  // namespace seatwise
