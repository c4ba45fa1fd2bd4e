#pragma once

#include "seatwise/concurrent/enrollment_id_generator.hpp"
#include "seatwise/concurrent/seat_ledger.hpp"
#include "seatwise/domain/enrollment.hpp"
#include "seatwise/enrollment/enrollment_result.hpp"
#include "seatwise/eventbus/event_bus.hpp"
#include "seatwise/repo/i_course_repository.hpp"
#include "seatwise/repo/i_enrollment_repository.hpp"
#include "seatwise/repo/i_student_repository.hpp"
#include "seatwise/validation/validator_chain.hpp"
#include "seatwise/waitlist/waitlist_queue.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace seatwise {

// -----------------------------------------------------------------------------
// EnrollmentCoordinator: admission-control state machine
// -----------------------------------------------------------------------------
//
// @brief  Turns enroll and drop requests into seat reservations, waitlist
//         entries and enrollment records, and promotes the head of the
//         waitlist whenever a drop frees a seat.
//
// @details
// Per (student, section) the record lifecycle is:
//
//   (none) ──> Enrolled ──> Dropped
//     │
//     └──────> Waitlisted
//
// enroll():
//   1. Resolve student, then section. Unknown -> NotFound, nothing written.
//   2. Unless admin_override, run the ValidatorChain.
//        SectionFull        -> waitlist the student (Waitlisted record).
//        ValidationRejected -> Rejected, nothing written.
//   3. SeatPool::reserve().
//        false -> waitlist the student, same as SectionFull (reserve race).
//        true  -> Enrolled record.
//
// drop():
//   1. Find the student's Enrolled record for the section. None -> NotFound.
//   2. Save it as Dropped, SeatPool::release().
//   3. WaitlistQueue::popNext(). If a student comes back, promote them by
//      running step 3 of enroll() with admin_override = true.
//
// Promotion:
//   Skips the ValidatorChain. The promoted student was validated when they
//   were queued.
//
// Reserve race:
//   A reserve() that fails after validation passed is treated exactly like
//   SectionFull. Callers never see a retryable conflict.
//
// Concurrency:
//   Each section has its own mutex (created lazily, never destroyed).
//   enroll() and drop() hold it for their whole body, so both are atomic
//   with respect to other requests for the same section, while requests for
//   different sections proceed in parallel. A drop performs its promotion
//   while still holding the section lock. The seat count is additionally
//   protected by the lock-free SeatPool, so enrolled <= capacity would hold
//   even without the section lock.
//
//   Every Enrolled record corresponds to exactly one successful reserve()
//   and every Enrolled -> Dropped transition to one release(), so the
//   section's seat count always equals its number of Enrolled records.
//
// Events:
//   Publishes EnrollmentUpdateEvent for each record written,
//   EnrollmentRejectedEvent for Rejected/NotFound results, and (via a
//   waitlist subscription registered in the constructor)
//   SeatAvailableEvent for each waitlist pop. Events are published on the
//   calling thread while the section lock is held.
//   The section lock is not reentrant: bus and waitlist subscribers must not
//   call enroll() or drop() from inside the callback, or the calling thread
//   deadlocks on the same section.
//
// Ownership:
//   Holds references to every collaborator; RegistrarEngine owns them all
//   and destroys the coordinator first.
// -----------------------------------------------------------------------------
class EnrollmentCoordinator {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Stores collaborator references and subscribes to the waitlist
  //         so every pop is republished as a SeatAvailableEvent.
  //
  // All references must remain valid for the coordinator's lifetime.
  // -------------------------------------------------------------------------
  EnrollmentCoordinator(const IStudentRepository& students,
                        const ICourseRepository& courses,
                        IEnrollmentRepository& enrollments,
                        SeatLedger& seats, WaitlistQueue& waitlist,
                        const ValidatorChain& validators,
                        EnrollmentIdGenerator& ids, EventBus& bus);

  // Unsubscribes from the waitlist.
  ~EnrollmentCoordinator();

  EnrollmentCoordinator(const EnrollmentCoordinator&) = delete;
  EnrollmentCoordinator& operator=(const EnrollmentCoordinator&) = delete;
  EnrollmentCoordinator(EnrollmentCoordinator&&) = delete;
  EnrollmentCoordinator& operator=(EnrollmentCoordinator&&) = delete;

  // -------------------------------------------------------------------------
  // enroll(student_id, section_id, admin_override)
  // -------------------------------------------------------------------------
  // @param  admin_override  Skip the ValidatorChain. Capacity is still
  //                         enforced by SeatPool::reserve().
  //
  // Thread-safety: Safe from any thread.
  // Side-effects:  May write one enrollment record, reserve one seat, enqueue
  //                one waitlist entry, publish events.
  // -------------------------------------------------------------------------
  EnrollResult enroll(const std::string& student_id,
                      const std::string& section_id, bool admin_override);

  // -------------------------------------------------------------------------
  // drop(student_id, section_id)
  // -------------------------------------------------------------------------
  // Thread-safety: Safe from any thread.
  // Side-effects:  Transitions one record to Dropped, releases one seat,
  //                may pop and promote one waitlisted student.
  // -------------------------------------------------------------------------
  DropResult drop(const std::string& student_id, const std::string& section_id);

 private:
  // Steps 2-3 of enroll(); the section mutex must be held.
  EnrollResult admitLocked(const domain::Student& student,
                           const domain::Section& section, bool admin_override);

  // Writes a Waitlisted record and enqueues the student; section mutex held.
  EnrollResult waitlistLocked(const domain::Student& student,
                              const domain::Section& section,
                              const std::string& message_prefix,
                              bool append_reason);

  // Builds a Rejected/NotFound result and publishes EnrollmentRejectedEvent.
  EnrollResult reject(EnrollOutcome outcome, const std::string& student_id,
                      const std::string& section_id, const std::string& reason,
                      const std::string& message);

  domain::Enrollment record(const domain::Student& student,
                            const domain::Section& section,
                            domain::EnrollmentStatus status);

  void publishUpdate(const domain::Enrollment& enrollment,
                     std::optional<domain::EnrollmentStatus> previous);

  std::mutex& sectionMutex(const std::string& section_id);

  const IStudentRepository& students_;
  const ICourseRepository& courses_;
  IEnrollmentRepository& enrollments_;
  SeatLedger& seats_;
  WaitlistQueue& waitlist_;
  const ValidatorChain& validators_;
  EnrollmentIdGenerator& ids_;
  EventBus& bus_;

  WaitlistQueue::SubscriptionId waitlist_sub_id_{0};
  std::atomic<std::uint64_t> sequence_{1};

  std::mutex registry_mutex_;  // Protects section_mutexes_ (the map only)
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> section_mutexes_;
};

}  // namespace seatwise
