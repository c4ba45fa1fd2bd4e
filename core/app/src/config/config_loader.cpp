#include "seatwise/config/config_loader.hpp"
#include "seatwise/validation/validator_chain.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace seatwise {

namespace {

// Copies obj[key] into out when present. Null counts as absent.
template <typename T>
void readOptional(const nlohmann::json& obj, const std::string& key, T& out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Config key '" + key +
                             "' has the wrong type: " + e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::string("Config parse error: ") + e.what());
  }

  if (!root.is_object()) {
    throw std::runtime_error("Config root must be a JSON object");
  }

  EngineConfig config;

  auto policy_it = root.find("policy");
  if (policy_it != root.end() && !policy_it->is_null()) {
    if (!policy_it->is_object()) {
      throw std::runtime_error("Config key 'policy' must be an object");
    }
    std::vector<std::string> order = config.policy.validator_order;
    readOptional(*policy_it, "validator_order", order);
    for (const auto& name : order) {
      if (!ValidatorChain::isKnown(name)) {
        throw std::runtime_error(
            "Config key 'policy.validator_order' names unknown validator: " +
            name);
      }
    }
    config.policy.validator_order = std::move(order);
  }

  readOptional(root, "ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  readOptional(root, "ipc_pub_endpoint", config.ipc_pub_endpoint);
  readOptional(root, "console_notifications", config.console_notifications);
  readOptional(root, "catalog_path", config.catalog_path);

  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open config file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace seatwise
