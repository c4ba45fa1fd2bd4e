#pragma once

#include "seatwise/domain/enrollment_policy.hpp"

#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// EngineConfig: startup settings for RegistrarEngine
// -----------------------------------------------------------------------------
//
// @details
// Plain value struct. main() fills it from a JSON file (see ConfigLoader) or
// leaves the defaults; tests build it directly. RegistrarEngine copies it at
// construction and never re-reads it.
//
// An empty ipc_cmd_endpoint or ipc_pub_endpoint disables the IpcServer.
// An empty catalog_path selects SampleCatalogSource in main().
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::EnrollmentPolicy policy;

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  /// Print a line per waitlist pop via ConsoleNotificationSink.
  bool console_notifications{true};

  std::string catalog_path;
};

}  // namespace seatwise
