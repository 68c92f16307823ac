#include "payflow/config/engine_config.hpp"
#include "payflow/errors/transaction_errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace payflow {

// -----------------------------------------------------------------------------
// parseEngineConfig(): defaults overridden by whichever keys are present
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("invalid config JSON: ") + e.what());
  }

  if (!j.is_object()) {
    throw ConfigError("config must be a JSON object");
  }

  EngineConfig config;

  if (auto it = j.find("id_prefix"); it != j.end()) {
    if (!it->is_string()) {
      throw ConfigError("config key 'id_prefix' must be a string");
    }
    config.id_prefix = it->get<std::string>();
  }

  if (auto it = j.find("log_transitions"); it != j.end()) {
    if (!it->is_boolean()) {
      throw ConfigError("config key 'log_transitions' must be a boolean");
    }
    config.log_transitions = it->get<bool>();
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig(): read whole file, then parse
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace payflow
