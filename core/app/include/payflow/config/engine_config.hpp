#pragma once

#include <string>

namespace payflow {

// -----------------------------------------------------------------------------
// EngineConfig — runtime settings for PaymentEngine
// -----------------------------------------------------------------------------
//
// @brief  Plain settings struct, copied into PaymentEngine at construction.
//
// @details
// The defaults are usable as-is; a JSON document may override any subset:
//
//   {
//     "id_prefix": "pay",
//     "log_transitions": true
//   }
//
// Unknown keys are ignored so one file can be shared with other tools.
// -----------------------------------------------------------------------------
struct EngineConfig {
  /// Prefix of generated transaction ids ("<prefix>-<uuid>"). Empty means
  /// bare UUIDs.
  std::string id_prefix{"txn"};

  /// Log every accepted lifecycle transition to stdout.
  bool log_transitions{false};
};

// -----------------------------------------------------------------------------
// parseEngineConfig(json_text)
// -----------------------------------------------------------------------------
// @brief  Builds an EngineConfig from a JSON object, starting from defaults.
//
// @throws ConfigError if the text is not a JSON object or a known key has
//         the wrong type.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads the file at path and parses it with parseEngineConfig().
//
// @throws ConfigError if the file cannot be opened or fails to parse.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace payflow
