/**
 * @file config.cpp
 * @brief Configuration parser implementation with JSON Schema validation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

#include "config_schema_embedded.h"  // Generated from config_schema.json

namespace hkpdb::config {

using hkp::utils::Error;
using hkp::utils::ErrorCode;
using hkp::utils::Expected;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

/**
 * @brief Convert YAML node to JSON object recursively
 *
 * Scalars that parse as JSON (numbers, booleans) keep their type; anything
 * else becomes a string.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      const auto& scalar = node.Scalar();
      if (node.Tag() == "!") {
        return scalar;  // Quoted in the document
      }
      json parsed = json::parse(scalar, nullptr, false);
      if (parsed.is_discarded() || parsed.is_object() || parsed.is_array()) {
        return scalar;
      }
      return parsed;
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

/**
 * @brief Parse storage configuration from JSON
 */
StorageConfig ParseStorageConfig(const json& json_obj) {
  StorageConfig config;

  if (json_obj.contains("backend")) {
    config.backend = json_obj["backend"].get<std::string>();
  }
  if (json_obj.contains("database")) {
    config.database = json_obj["database"].get<std::string>();
  }
  if (json_obj.contains("collection")) {
    config.collection = json_obj["collection"].get<std::string>();
  }
  if (json_obj.contains("pool_size")) {
    config.pool_size = json_obj["pool_size"].get<int>();
  }
  if (json_obj.contains("acquire_timeout_ms")) {
    config.acquire_timeout_ms = json_obj["acquire_timeout_ms"].get<int>();
  }

  return config;
}

/**
 * @brief Parse MySQL configuration from JSON
 */
MysqlConfig ParseMysqlConfig(const json& json_obj) {
  MysqlConfig config;

  if (json_obj.contains("host")) {
    config.host = json_obj["host"].get<std::string>();
  }
  if (json_obj.contains("port")) {
    config.port = json_obj["port"].get<int>();
  }
  if (json_obj.contains("user")) {
    config.user = json_obj["user"].get<std::string>();
  }
  if (json_obj.contains("password")) {
    config.password = json_obj["password"].get<std::string>();
  }
  if (json_obj.contains("database")) {
    config.database = json_obj["database"].get<std::string>();
  }
  if (json_obj.contains("connect_timeout_ms")) {
    config.connect_timeout_ms = json_obj["connect_timeout_ms"].get<int>();
  }
  if (json_obj.contains("read_timeout_ms")) {
    config.read_timeout_ms = json_obj["read_timeout_ms"].get<int>();
  }
  if (json_obj.contains("write_timeout_ms")) {
    config.write_timeout_ms = json_obj["write_timeout_ms"].get<int>();
  }
  if (json_obj.contains("ssl_enable")) {
    config.ssl_enable = json_obj["ssl_enable"].get<bool>();
  }
  if (json_obj.contains("ssl_ca")) {
    config.ssl_ca = json_obj["ssl_ca"].get<std::string>();
  }
  if (json_obj.contains("ssl_cert")) {
    config.ssl_cert = json_obj["ssl_cert"].get<std::string>();
  }
  if (json_obj.contains("ssl_key")) {
    config.ssl_key = json_obj["ssl_key"].get<std::string>();
  }
  if (json_obj.contains("ssl_verify_server_cert")) {
    config.ssl_verify_server_cert = json_obj["ssl_verify_server_cert"].get<bool>();
  }

  return config;
}

/**
 * @brief Check cross-field constraints the schema cannot express
 */
Expected<void, Error> ValidateConfig(const Config& config) {
  static const std::set<std::string> kBackends = {"memory", "mysql"};
  static const std::set<std::string> kLogLevels = {"debug", "info", "warn", "error"};

  if (kBackends.count(config.storage.backend) == 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue,
                  "storage.backend must be 'memory' or 'mysql', got '" + config.storage.backend + "'"));
  }
  if (config.storage.pool_size < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "storage.pool_size must be at least 1"));
  }
  if (config.query.result_limit < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "query.result_limit must be at least 1"));
  }
  if (kLogLevels.count(config.logging.level) == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue,
                                    "logging.level must be one of debug, info, warn, error; got '" +
                                        config.logging.level + "'"));
  }
  if (config.storage.backend == "mysql" && config.mysql.user.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigMissingRequired, "mysql.user is required when storage.backend is 'mysql'"));
  }
  return {};
}

/**
 * @brief Parse root configuration from JSON
 */
Expected<Config, Error> ParseConfigFromJson(const json& root) {
  Config config;

  try {
    if (root.contains("storage")) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root.contains("mysql")) {
      config.mysql = ParseMysqlConfig(root["mysql"]);
    }
    if (root.contains("query")) {
      const auto& query = root["query"];
      if (query.contains("result_limit")) {
        config.query.result_limit = query["result_limit"].get<int>();
      }
    }
    if (root.contains("logging")) {
      const auto& log = root["logging"];
      if (log.contains("level")) {
        config.logging.level = log["level"].get<std::string>();
      }
      if (log.contains("file")) {
        config.logging.file = log["file"].get<std::string>();
      }
    }
  } catch (const json::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue, std::string("Invalid configuration value: ") + e.what()));
  }

  auto valid = ValidateConfig(config);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }
  return config;
}

/**
 * @brief Read file contents as string
 */
Expected<std::string, Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file: " + path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration file is empty: " + path));
  }
  return content;
}

Expected<std::string, Error> ReadSchema(const std::string& schema_path) {
  if (schema_path.empty()) {
    return std::string();
  }
  return ReadFileToString(schema_path);
}

void LogLoaded(const std::string& path, const Config& config) {
  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::info("  Storage: {} ({}.{})", config.storage.backend, config.storage.database, config.storage.collection);
  if (config.storage.backend == "mysql") {
    spdlog::info("  MySQL: {}:{}@{}:{}", config.mysql.user, std::string(config.mysql.password.length(), '*'),
                 config.mysql.host, config.mysql.port);
  }
}

/**
 * @brief Detect file format based on extension
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

constexpr size_t kJsonExtLength = 5;  // ".json"
constexpr size_t kYamlExtLength = 5;  // ".yaml"
constexpr size_t kYmlExtLength = 4;   // ".yml"

FileFormat DetectFileFormat(const std::string& path) {
  if (path.size() >= kJsonExtLength && path.substr(path.size() - kJsonExtLength) == ".json") {
    return FileFormat::kJson;
  }
  if (path.size() >= kYamlExtLength && path.substr(path.size() - kYamlExtLength) == ".yaml") {
    return FileFormat::kYaml;
  }
  if (path.size() >= kYmlExtLength && path.substr(path.size() - kYmlExtLength) == ".yml") {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

}  // namespace

Expected<void, Error> ValidateConfigJson(const std::string& config_json_str, const std::string& schema_json_str) {
  json config_json = json::parse(config_json_str, nullptr, false);
  if (config_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, "Configuration is not valid JSON"));
  }

  // Use embedded schema if no custom schema provided
  std::string schema_to_use = schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str;
  json schema_json = json::parse(schema_to_use, nullptr, false);
  if (schema_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, "Configuration schema is not valid JSON"));
  }

  try {
    json_validator validator;
    validator.set_root_schema(schema_json);
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigValidationError, std::string("Configuration validation failed: ") + e.what()));
  }

  spdlog::debug("Configuration validation passed");
  return {};
}

Expected<Config, Error> LoadConfigJson(const std::string& path, const std::string& schema_path) {
  auto config_str = ReadFileToString(path);
  if (!config_str) {
    return MakeUnexpected(config_str.error());
  }

  json config_json = json::parse(*config_str, nullptr, false);
  if (config_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, "JSON parse error in configuration file: " + path));
  }

  auto schema_str = ReadSchema(schema_path);
  if (!schema_str) {
    return MakeUnexpected(schema_str.error());
  }
  auto valid = ValidateConfigJson(*config_str, *schema_str);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }

  auto config = ParseConfigFromJson(config_json);
  if (config) {
    LogLoaded(path, *config);
  }
  return config;
}

Expected<Config, Error> LoadConfigYaml(const std::string& path, const std::string& schema_path) {
  json json_root;
  try {
    YAML::Node yaml_root = YAML::LoadFile(path);
    json_root = YamlToJson(yaml_root);
  } catch (const YAML::BadFile&) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file: " + path));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error in configuration file: " << path << ": " << e.what();
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, err_msg.str()));
  }

  // An empty document is an empty configuration
  if (json_root.is_null()) {
    json_root = json::object();
  }

  auto schema_str = ReadSchema(schema_path);
  if (!schema_str) {
    return MakeUnexpected(schema_str.error());
  }
  auto valid = ValidateConfigJson(json_root.dump(), *schema_str);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }

  auto config = ParseConfigFromJson(json_root);
  if (config) {
    LogLoaded(path, *config);
  }
  return config;
}

Expected<Config, Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      spdlog::debug("Detected JSON format for config file: {}", path);
      return LoadConfigJson(path, schema_path);

    case FileFormat::kYaml:
      spdlog::debug("Detected YAML format for config file: {}", path);
      return LoadConfigYaml(path, schema_path);

    case FileFormat::kUnknown:
    default: {
      spdlog::debug("Unknown file format, trying YAML first: {}", path);
      auto yaml_result = LoadConfigYaml(path, schema_path);
      if (yaml_result || yaml_result.error().code() == ErrorCode::kConfigFileNotFound) {
        return yaml_result;
      }
      spdlog::debug("YAML parsing failed, trying JSON: {}", path);
      auto json_result = LoadConfigJson(path, schema_path);
      if (json_result) {
        return json_result;
      }
      return MakeUnexpected(MakeError(json_result.error().code(),
                                      "Failed to load configuration file: " + path +
                                          " (YAML: " + yaml_result.error().message() +
                                          "; JSON: " + json_result.error().message() + ")"));
    }
  }
}

}  // namespace hkpdb::config
