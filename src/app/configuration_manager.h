/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading and validating configuration files
 */

#ifndef HKPDB_APP_CONFIGURATION_MANAGER_H_
#define HKPDB_APP_CONFIGURATION_MANAGER_H_

#include <iosfwd>
#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::app {

using hkp::utils::Error;
using hkp::utils::Expected;

/**
 * @brief Configuration manager
 *
 * Owns the loaded Config and applies its logging section. An empty
 * config_file yields the built-in defaults (in-memory backend).
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load initial configuration
   * @param config_file Path to configuration file (empty = defaults)
   * @param schema_file Optional schema file path (empty = use built-in)
   * @return Expected with manager instance or error
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "");

  ~ConfigurationManager() = default;

  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Test mode: print configuration details
   * @return Exit code (0 = success)
   */
  int PrintConfigTest(std::ostream& out) const;

  /**
   * @brief Apply logging configuration
   *
   * Sets the spdlog level and, when a log file is configured, replaces the
   * default logger with a file logger (creating the directory if needed).
   */
  Expected<void, Error> ApplyLoggingConfig();

  const std::string& GetConfigFilePath() const { return config_file_; }

  const std::string& GetSchemaFilePath() const { return schema_file_; }

 private:
  ConfigurationManager(std::string config_file, std::string schema_file, config::Config initial_config);

  std::string config_file_;
  std::string schema_file_;
  config::Config config_;
};

}  // namespace hkpdb::app

#endif  // HKPDB_APP_CONFIGURATION_MANAGER_H_
