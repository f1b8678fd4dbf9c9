#include "reconcile/config.h"
#include "common/logging.h"
#include <fstream>
#include <limits>
#include <sstream>

namespace autoscale {
namespace reconcile {

namespace {

const std::string kModule = "config";

template <typename T>
bool read_unsigned(const nlohmann::json &json, const char *key, T &out,
                   std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!it->is_number_integer() ||
      (!it->is_number_unsigned() && it->get<int64_t>() < 0)) {
    error = std::string("\"") + key + "\" must be a non-negative integer";
    return false;
  }
  uint64_t value = it->get<uint64_t>();
  if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    error = std::string("\"") + key + "\" is out of range (max " +
            std::to_string(std::numeric_limits<T>::max()) + ")";
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

bool read_string(const nlohmann::json &json, const char *key, std::string &out,
                 std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("\"") + key + "\" must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_bool(const nlohmann::json &json, const char *key, bool &out,
               std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!it->is_boolean()) {
    error = std::string("\"") + key + "\" must be a boolean";
    return false;
  }
  out = it->get<bool>();
  return true;
}

} // namespace

AutoscaleConfig ConfigManager::create_default() { return AutoscaleConfig(); }

common::Result<AutoscaleConfig>
ConfigManager::load_from_json(const nlohmann::json &json,
                              const AutoscaleConfig &base) {
  if (!json.is_object()) {
    return common::Result<AutoscaleConfig>(
        "configuration must be a JSON object");
  }

  AutoscaleConfig config = base;
  std::string error;
  bool ok = read_unsigned(json, "pollTime", config.poll_interval_ms, error) &&
            read_unsigned(json, "pollIntervalMs", config.poll_interval_ms,
                          error) &&
            read_string(json, "groupPath", config.group_path, error) &&
            read_string(json, "nodeType", config.node_type, error) &&
            read_string(json, "nodeId", config.node_id, error) &&
            read_string(json, "logLevel", config.log_level, error) &&
            read_bool(json, "jsonLogs", config.json_logs, error) &&
            read_bool(json, "asyncLogging", config.async_logging, error) &&
            read_string(json, "requirementsPath", config.requirements_path,
                        error) &&
            read_unsigned(json, "nodes", config.demo_nodes, error) &&
            read_unsigned(json, "runSeconds", config.run_seconds, error) &&
            read_unsigned(json, "failoverAfterSeconds",
                          config.failover_after_seconds, error);
  if (!ok) {
    return common::Result<AutoscaleConfig>(error);
  }
  return common::Result<AutoscaleConfig>(std::move(config));
}

common::Result<AutoscaleConfig>
ConfigManager::load_from_file(const std::string &config_path,
                              const AutoscaleConfig &base) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    return common::Result<AutoscaleConfig>("cannot open config file " +
                                           config_path);
  }

  try {
    nlohmann::json json;
    file >> json;
    auto result = load_from_json(json, base);
    if (result.is_ok()) {
      LOG_DEBUG(kModule, "loaded ", config_path);
    }
    return result;
  } catch (const nlohmann::json::exception &e) {
    return common::Result<AutoscaleConfig>("invalid JSON in " + config_path +
                                           ": " + e.what());
  }
}

nlohmann::json ConfigManager::to_json(const AutoscaleConfig &config) {
  return nlohmann::json{{"pollIntervalMs", config.poll_interval_ms},
                        {"groupPath", config.group_path},
                        {"nodeType", config.node_type},
                        {"nodeId", config.node_id},
                        {"logLevel", config.log_level},
                        {"jsonLogs", config.json_logs},
                        {"asyncLogging", config.async_logging},
                        {"requirementsPath", config.requirements_path},
                        {"nodes", config.demo_nodes},
                        {"runSeconds", config.run_seconds},
                        {"failoverAfterSeconds",
                         config.failover_after_seconds}};
}

std::string ConfigManager::validate_config(const AutoscaleConfig &config) {
  if (config.poll_interval_ms < 1) {
    return "Poll interval must be at least 1ms";
  }

  if (config.group_path.empty() || config.group_path.front() != '/') {
    return "Group path must be an absolute path";
  }

  if (config.node_type.empty()) {
    return "Node type cannot be empty";
  }

  common::LogLevel level;
  if (!common::parse_log_level(config.log_level, level)) {
    return "Unknown log level: " + config.log_level;
  }

  if (config.demo_nodes < 1) {
    return "At least one controller node is required";
  }

  return "";
}

} // namespace reconcile
} // namespace autoscale
