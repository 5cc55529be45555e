#include "common/config.h"
#include <fstream>
#include <sstream>

namespace keel {
namespace common {

using json = nlohmann::json;

RuntimeConfig RuntimeConfigManager::create_default() { return RuntimeConfig{}; }

std::optional<RuntimeConfig>
RuntimeConfigManager::load_from_json(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  RuntimeConfig config = create_default();
  try {
    if (j.contains("log_level")) {
      config.log_level = j.at("log_level").get<std::string>();
    }
    if (j.contains("json_logs")) {
      config.json_logs = j.at("json_logs").get<bool>();
    }
    if (j.contains("max_cpi_depth")) {
      config.max_cpi_depth = j.at("max_cpi_depth").get<uint32_t>();
    }
    if (j.contains("prefer_fast_path")) {
      config.prefer_fast_path = j.at("prefer_fast_path").get<bool>();
    }
  } catch (const json::exception &e) {
    LOG_WARN("config", "Rejecting runtime configuration: ", e.what());
    return std::nullopt;
  }

  return config;
}

Result<RuntimeConfig> RuntimeConfigManager::load_from_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<RuntimeConfig>(Error::invalid_input("cannot open config file " + path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  json j;
  try {
    j = json::parse(buffer.str());
  } catch (const json::parse_error &e) {
    return Result<RuntimeConfig>(
        Error::invalid_input("config file " + path + " is not valid JSON: " + e.what()));
  }

  auto config = load_from_json(j);
  if (!config) {
    return Result<RuntimeConfig>(Error::invalid_input("config file " + path + " has invalid fields"));
  }

  std::string problem = validate_config(*config);
  if (!problem.empty()) {
    return Result<RuntimeConfig>(Error::invalid_input(problem));
  }
  return Result<RuntimeConfig>(*config);
}

json RuntimeConfigManager::to_json(const RuntimeConfig &config) {
  json j;
  j["log_level"] = config.log_level;
  j["json_logs"] = config.json_logs;
  j["max_cpi_depth"] = config.max_cpi_depth;
  j["prefer_fast_path"] = config.prefer_fast_path;
  return j;
}

std::string RuntimeConfigManager::validate_config(const RuntimeConfig &config) {
  LogLevel level;
  if (!Logger::parse_level(config.log_level, level)) {
    return "Unknown log level: " + config.log_level;
  }

  if (config.max_cpi_depth == 0 || config.max_cpi_depth > 64) {
    return "Max CPI depth must be between 1 and 64";
  }

  return "";
}

void RuntimeConfigManager::apply_logging(const RuntimeConfig &config) {
  LogLevel level;
  if (Logger::parse_level(config.log_level, level)) {
    Logger::instance().set_level(level);
  }
  Logger::instance().set_json_format(config.json_logs);
}

} // namespace common
} // namespace keel
