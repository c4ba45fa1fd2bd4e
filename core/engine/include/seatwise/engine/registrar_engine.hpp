#pragma once

#include "seatwise/catalog/i_catalog_source.hpp"
#include "seatwise/concurrent/enrollment_id_generator.hpp"
#include "seatwise/concurrent/seat_ledger.hpp"
#include "seatwise/config/engine_config.hpp"
#include "seatwise/enrollment/enrollment_coordinator.hpp"
#include "seatwise/enrollment/enrollment_result.hpp"
#include "seatwise/eventbus/event_bus.hpp"
#include "seatwise/network/ipc_server.hpp"
#include "seatwise/notification/console_notification_sink.hpp"
#include "seatwise/repo/in_memory_course_repository.hpp"
#include "seatwise/repo/in_memory_enrollment_repository.hpp"
#include "seatwise/repo/in_memory_student_repository.hpp"
#include "seatwise/validation/validator_chain.hpp"
#include "seatwise/waitlist/waitlist_queue.hpp"

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <optional>
#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// RegistrarEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns and wires every registration component; the programmatic
//         root used by main() and by tests.
//
// @details
// Construction builds the repositories, the seat ledger, the waitlist, the
// validator chain (from config.policy) and the EnrollmentCoordinator. The
// engine can serve enroll()/drop() immediately; start() adds the startup
// catalog and the outward-facing pieces.
//
// start(catalog):
//   1. Hydration from the ICatalogSource (first start only):
//      entities -> repositories, one SeatPool per section, Enrolled counts
//      -> SeatPool::resetEnrolledCount(), Waitlisted records -> waitlist in
//      order, id generator advanced past the largest hydrated "E<n>".
//   2. Console notifications (if config.console_notifications).
//   3. IpcServer with its telemetry bridge (if both endpoints are set).
//
// stop() reverses 3 and 2. Records and seat counts survive stop(); a later
// start() brings the IPC server back without re-hydrating.
//
// Thread model:
//   Construct, start(), stop() and destroy on one thread (main).
//   enroll(), drop() and executeCommand() are safe from any thread and are
//   also called on the IpcServer worker.
//
// Ownership:
//   RegistrarEngine
//    ├── students_, courses_, enrollments_  (in-memory repositories)
//    ├── seats_                             (SeatLedger)
//    ├── waitlist_                          (WaitlistQueue)
//    ├── ids_                               (EnrollmentIdGenerator)
//    ├── bus_                               (EventBus)
//    ├── validators_                        (ValidatorChain)
//    ├── coordinator_   (unique_ptr; references everything above)
//    ├── console_sink_  (unique_ptr; subscribed while running)
//    └── ipc_server_    (shared_ptr, shared with the telemetry bridge;
//                        stopped and released by stop())
//
// Members are declared so that reverse destruction tears down the IPC
// thread first, then the coordinator, then the state it references.
// -----------------------------------------------------------------------------
class RegistrarEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument if config.policy names an unknown
  //         validator.
  //
  // No thread is spawned and no socket is opened.
  // -------------------------------------------------------------------------
  explicit RegistrarEngine(EngineConfig config = {});

  // Destructor calls stop().
  ~RegistrarEngine();

  RegistrarEngine(const RegistrarEngine&) = delete;
  RegistrarEngine& operator=(const RegistrarEngine&) = delete;
  RegistrarEngine(RegistrarEngine&&) = delete;
  RegistrarEngine& operator=(RegistrarEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(catalog)
  // -------------------------------------------------------------------------
  // @param  catalog  Optional, non-owning. Used on the first start() only;
  //                  ignored (with a warning) once a catalog was loaded.
  //
  // @throws std::runtime_error when the catalog is inconsistent (a section
  //         with more Enrolled records than seats, records for unknown
  //         sections), std::invalid_argument for a negative capacity,
  //         zmq::error_t when an endpoint cannot be bound. The engine is
  //         left stopped on any throw.
  //
  // Idempotent while running.
  // -------------------------------------------------------------------------
  void start(ICatalogSource* catalog = nullptr);

  // Stops the IPC server and detaches the console sink. Idempotent.
  void stop();

  bool running() const { return running_; }

  // Forward to EnrollmentCoordinator.
  EnrollResult enroll(const std::string& student_id,
                      const std::string& section_id,
                      bool admin_override = false);
  DropResult drop(const std::string& student_id, const std::string& section_id);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one IPC command and returns the JSON reply.
  //
  // @param  cmd  Either a JSON object with a "cmd" field, e.g.
  //                {"cmd":"ENROLL","student_id":"S1","section_id":"SEC1"}
  //              or whitespace-separated words, e.g.
  //                ENROLL S1 SEC1 [admin]
  //
  // @details
  //   PING         -> {"status":"ok","response":"PONG"}
  //   ENROLL       -> {"status":"ok","result":..,"outcome":..,
  //                    "enrollment_id":..|null}
  //                   args: student_id, section_id, admin (bool, optional)
  //   DROP         -> {"status":"ok","result":..,"outcome":..,
  //                    "promoted":bool,"promoted_student_id":..|null}
  //                   args: student_id, section_id
  //   STATUS       -> {"status":"ok","sections":[{section_id, course_id,
  //                    capacity, enrolled, available, waitlist:[..]}]}
  //   ENROLLMENTS  -> {"status":"ok","enrollments":[..]}
  //                   optional filter: student_id or section_id
  //   CATALOG      -> {"status":"ok","courses":[{.., "sections":[..]}]}
  //   other        -> {"status":"error","response":"Unknown command: .."}
  //
  // Malformed input (bad JSON, missing or mistyped arguments) yields
  // {"status":"error","response":<message>}. Enrollment outcomes that are
  // not successes (Rejected, NotFound) are still "status":"ok"; the outcome
  // field carries them.
  //
  // Thread-safety: Safe to call from any thread. Never throws for bad input.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Subscribe before start() to see hydration-time state changes as they
  // happen afterwards (hydration itself publishes nothing).
  EventBus& eventBus() { return bus_; }

  const EngineConfig& config() const { return config_; }
  const SeatLedger& seats() const { return seats_; }
  const WaitlistQueue& waitlist() const { return waitlist_; }
  const IEnrollmentRepository& enrollments() const { return enrollments_; }
  const ICourseRepository& courses() const { return courses_; }
  const IStudentRepository& students() const { return students_; }

 private:
  void hydrate(ICatalogSource& catalog);

  nlohmann::json handleEnroll(const nlohmann::json& args);
  nlohmann::json handleDrop(const nlohmann::json& args);
  nlohmann::json handleStatus() const;
  nlohmann::json handleEnrollments(const nlohmann::json& args) const;
  nlohmann::json handleCatalog() const;

  EngineConfig config_;

  // --- State (value members; outlive everything that references them) -------
  InMemoryStudentRepository students_;
  InMemoryCourseRepository courses_;
  InMemoryEnrollmentRepository enrollments_;
  SeatLedger seats_;
  WaitlistQueue waitlist_;
  EnrollmentIdGenerator ids_;
  EventBus bus_;
  ValidatorChain validators_;

  // --- Components ------------------------------------------------------------
  std::unique_ptr<EnrollmentCoordinator> coordinator_;
  std::unique_ptr<ConsoleNotificationSink> console_sink_;
  std::shared_ptr<IpcServer> ipc_server_;

  std::optional<WaitlistQueue::SubscriptionId> console_sub_id_;
  std::optional<EventBus::SubscriptionId> telemetry_sub_id_;

  bool hydrated_{false};
  bool running_{false};
};

}  // namespace seatwise
