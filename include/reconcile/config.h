#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace autoscale {
namespace reconcile {

/**
 * @brief Runtime configuration of an autoscale controller node
 */
struct AutoscaleConfig {
  // Reconciliation
  uint32_t poll_interval_ms = 10000; ///< Milliseconds between periodic passes

  // Membership
  std::string group_path = "/autoscale/controllers"; ///< Election group
  std::string node_type = "autoscaler";
  std::string node_id; ///< Defaults to a generated id when empty

  // Logging
  std::string log_level = "info"; ///< trace/debug/info/warn/error/critical
  bool json_logs = false;
  bool async_logging = false;

  // Daemon
  std::string requirements_path; ///< JSON requirements document to load
  uint32_t demo_nodes = 2;       ///< Controller nodes to run in-process
  uint32_t run_seconds = 0;      ///< 0 runs until interrupted
  uint32_t failover_after_seconds = 0; ///< Close the master after this long
};

class ConfigManager {
public:
  static AutoscaleConfig create_default();

  /**
   * @brief Overlay JSON keys onto base
   *
   * Unknown keys are ignored; a present key of the wrong type is an error.
   */
  static common::Result<AutoscaleConfig>
  load_from_json(const nlohmann::json &json,
                 const AutoscaleConfig &base = AutoscaleConfig());

  static common::Result<AutoscaleConfig>
  load_from_file(const std::string &config_path,
                 const AutoscaleConfig &base = AutoscaleConfig());

  static nlohmann::json to_json(const AutoscaleConfig &config);

  /// @return validation error message, or empty string if valid
  static std::string validate_config(const AutoscaleConfig &config);
};

} // namespace reconcile
} // namespace autoscale
