#include "seatwise/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace seatwise {

namespace {

std::int64_t toEpochMs(const Timestamp& ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             ts.time_since_epoch())
      .count();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  cmd_socket->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket->set(zmq::sockopt::linger, 0);
  pub_socket->set(zmq::sockopt::linger, 0);

  // A failed bind throws here and the locals clean up the partial state.
  cmd_socket->bind(cmd_endpoint_);
  pub_socket->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd_socket);
  pub_socket_ = std::move(pub_socket);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  if (!telemetry_queue_.push(std::move(event))) {
    std::uint64_t dropped = telemetry_queue_.rejected();
    if (dropped == 1 || dropped % 1000 == 0) {
      std::cerr << "[IpcServer] telemetry buffer full; " << dropped
                << " event(s) dropped so far\n";
    }
  }
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever was queued before stop().
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  for (const auto& event : telemetry_queue_.drain()) {
    std::string payload = formatTelemetry(event);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one bounded recv, one reply
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());

  // REP must answer every request, so a throwing handler still gets a reply.
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler failed: " << e.what() << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = e.what();
    response = error.dump();
  } catch (...) {
    std::cerr << "[IpcServer] command handler failed: unknown exception\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = "Internal error";
    response = error.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per Event alternative
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j = std::visit(
      [](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json out;
        if constexpr (std::is_same_v<T, EnrollmentUpdateEvent>) {
          out["type"] = "enrollment_update";
          out["enrollment_id"] = e.enrollment.id;
          out["student_id"] = e.enrollment.student_id;
          out["section_id"] = e.enrollment.section_id;
          out["status"] = domain::toString(e.enrollment.status);
          if (e.previous_status) {
            out["previous_status"] = domain::toString(*e.previous_status);
          } else {
            out["previous_status"] = nullptr;
          }
        } else if constexpr (std::is_same_v<T, EnrollmentRejectedEvent>) {
          out["type"] = "enrollment_rejected";
          out["student_id"] = e.student_id;
          out["section_id"] = e.section_id;
          out["reason"] = e.reason;
        } else {
          static_assert(std::is_same_v<T, SeatAvailableEvent>,
                        "formatTelemetry: unhandled Event alternative");
          out["type"] = "seat_available";
          out["section_id"] = e.section_id;
          out["student_id"] = e.student_id;
        }
        out["sequence_id"] = e.sequence_id;
        out["timestamp_ms"] = toEpochMs(e.timestamp);
        return out;
      },
      event);
  return j.dump();
}

}  // namespace seatwise
