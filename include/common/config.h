#pragma once

#include "common/logging.h"
#include "common/types.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace keel {
namespace common {

/**
 * @brief Process-wide runtime settings for programs and the local host
 *
 * Defaults match the Solana mainnet runtime where a setting mirrors a
 * runtime limit.
 */
struct RuntimeConfig {
  std::string log_level = "info";       ///< trace/debug/info/warn/error/critical
  bool json_logs = false;               ///< Emit log lines as JSON objects
  uint32_t max_cpi_depth = 4;           ///< Nested cross-program calls allowed below the top-level call
  bool prefer_fast_path = true;         ///< Use offset tables when every account size is fixed
};

/**
 * @brief Loading, validation and application of RuntimeConfig
 */
class RuntimeConfigManager {
public:
  /// Default configuration
  static RuntimeConfig create_default();

  /**
   * @brief Build a configuration from a JSON object
   *
   * Missing keys keep their defaults; keys with the wrong JSON type make
   * the whole load fail.
   */
  static std::optional<RuntimeConfig> load_from_json(const nlohmann::json &json);

  /// Read and parse a JSON file
  static Result<RuntimeConfig> load_from_file(const std::string &path);

  static nlohmann::json to_json(const RuntimeConfig &config);

  /**
   * @brief Check ranges and enumerations
   * @return Empty string when valid, otherwise the first problem found
   */
  static std::string validate_config(const RuntimeConfig &config);

  /// Push log level and format into the global Logger
  static void apply_logging(const RuntimeConfig &config);
};

} // namespace common
} // namespace keel
