/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <ostream>

namespace hkpdb::app {

using hkp::utils::ErrorCode;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                    const std::string& schema_file) {
  config::Config loaded;
  if (!config_file.empty()) {
    auto config_result = config::LoadConfig(config_file, schema_file);
    if (!config_result) {
      return MakeUnexpected(config_result.error());
    }
    loaded = std::move(*config_result);
  }

  auto manager =
      std::unique_ptr<ConfigurationManager>(new ConfigurationManager(config_file, schema_file, std::move(loaded)));
  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, std::string schema_file,
                                           config::Config initial_config)
    : config_file_(std::move(config_file)), schema_file_(std::move(schema_file)), config_(std::move(initial_config)) {}

int ConfigurationManager::PrintConfigTest(std::ostream& out) const {
  out << "Configuration file syntax is OK\n";
  out << "Configuration details:\n";
  out << "  Storage: " << config_.storage.backend << " (" << config_.storage.database << "."
      << config_.storage.collection << ")\n";
  if (config_.storage.backend == "mysql") {
    out << "  MySQL: " << config_.mysql.user << "@" << config_.mysql.host << ":" << config_.mysql.port
        << " (pool_size: " << config_.storage.pool_size << ")\n";
  }
  out << "  Result limit: " << config_.query.result_limit << "\n";
  out << "  Logging level: " << config_.logging.level << "\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Output first, then level (the level applies to the new default logger)
  if (!config_.logging.file.empty()) {
    try {
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }

      auto file_logger = spdlog::basic_logger_mt("hkpdb", config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
    } catch (const std::exception& ex) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
    }
  }

  if (config_.logging.level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.logging.level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.logging.level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.logging.level == "error") {
    spdlog::set_level(spdlog::level::err);
  }

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }

  return {};
}

}  // namespace hkpdb::app
