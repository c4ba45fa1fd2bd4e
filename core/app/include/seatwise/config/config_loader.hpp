#pragma once

#include "seatwise/config/engine_config.hpp"

#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// parseEngineConfig(text)
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a JSON document.
//
// @details
// Recognised keys (all optional; a missing key keeps its default):
//
//   {
//     "policy": { "validator_order": ["prerequisite", "capacity",
//                                     "time_conflict"] },
//     "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//     "ipc_pub_endpoint": "tcp://127.0.0.1:5557",
//     "console_notifications": true,
//     "catalog_path": "config/catalog.json"
//   }
//
// Unknown top-level keys are ignored.
//
// @throws std::runtime_error on malformed JSON, a value of the wrong type
//         (the message names the key), or an unknown validator name.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& text);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// Reads `path` and forwards to parseEngineConfig().
//
// @throws std::runtime_error if the file cannot be opened, plus everything
//         parseEngineConfig() throws.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace seatwise
