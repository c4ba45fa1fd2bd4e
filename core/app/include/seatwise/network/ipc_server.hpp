#pragma once

#include "seatwise/concurrent/thread_safe_queue.hpp"
#include "seatwise/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace seatwise {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers registrar commands on a REP
//         socket and broadcasts enrollment telemetry on a PUB socket.
//
// @details
// Two ZeroMQ sockets share the worker thread:
//
//   1. REP socket (cmd_endpoint, default port 5556):
//      Receives one command string per request, passes it to the
//      CommandHandler (bound to RegistrarEngine::executeCommand()) and
//      sends back the JSON reply. ZMQ_RCVTIMEO bounds each recv so the
//      thread can alternate with telemetry draining and notice stop().
//
//   2. PUB socket (pub_endpoint, default port 5557):
//      Publishes one JSON message per Event pushed via pushTelemetry().
//      Events are buffered in a ThreadSafeQueue, so the request thread that
//      produced them never waits on serialisation or socket I/O. The buffer
//      holds at most kTelemetryQueueLimit events; beyond that new events are
//      dropped and counted (see droppedTelemetry()).
//
// Thread model:
//   Constructed, started and stopped on the owning thread (RegistrarEngine,
//   i.e. main). pushTelemetry() is safe from any thread. The CommandHandler
//   runs on the worker thread and must be thread-safe with respect to
//   direct callers of the engine.
//
// Ownership:
//   Held by RegistrarEngine via std::shared_ptr, shared with the EventBus
//   telemetry bridge. Owns the ZMQ context, both sockets, the telemetry
//   queue and the worker thread. pushTelemetry() after stop() only queues.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler  Called for each REP request; returns the reply.
  // @param  cmd_endpoint     Bind address for the REP socket.
  // @param  pub_endpoint     Bind address for the PUB socket.
  //
  // No sockets are opened and no thread is spawned until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop() if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // Idempotent.
  //
  // @throws zmq::error_t if either bind fails (e.g. port in use). Nothing is
  //         left running in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears the running flag, joins the worker (within kPollTimeoutMs) and
  // closes the sockets. Telemetry still queued is published first.
  // Idempotent; safe if never started.
  // -------------------------------------------------------------------------
  void stop();

  // Thread-safe, non-blocking. Drops the event when the buffer is full.
  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  std::uint64_t droppedTelemetry() const { return telemetry_queue_.rejected(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  Renders one Event as the JSON text published on the PUB socket.
  //
  //   {"type":"enrollment_update","enrollment_id":"E3","student_id":"S2",
  //    "section_id":"SEC1","status":"ENROLLED","previous_status":null,
  //    "sequence_id":7,"timestamp_ms":...}
  //   {"type":"enrollment_rejected","student_id":..,"section_id":..,
  //    "reason":..,"sequence_id":..,"timestamp_ms":..}
  //   {"type":"seat_available","section_id":..,"student_id":..,
  //    "sequence_id":..,"timestamp_ms":..}
  //
  // Pure function.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryQueueLimit = 10000;

  // Worker loop: drain telemetry, then wait up to kPollTimeoutMs for one
  // command. Repeats until stop().
  void run();

  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryQueueLimit};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace seatwise
