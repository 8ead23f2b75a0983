#include "core/migration_config.h"
#include "core/migration_settings.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>

using json = nlohmann::json;

ConnectionParams MigrationConfig::source_;
ConnectionParams MigrationConfig::target_;
std::vector<std::string> MigrationConfig::tables_;
bool MigrationConfig::allTables_ = false;
bool MigrationConfig::rowCountHints_ = true;
std::string MigrationConfig::reportFile_;
LoggingSettings MigrationConfig::logging_;
bool MigrationConfig::initialized_ = false;
std::mutex MigrationConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  try {
    int portNum = std::stoi(portStr);
    if (portNum > 0 && portNum <= 65535) {
      targetPort = portStr;
      return true;
    }
  } catch (const std::exception &) {
  }
  return false;
}

std::string portToString(const json &value) {
  if (value.is_number_integer())
    return std::to_string(value.get<int>());
  if (value.is_string())
    return value.get<std::string>();
  return "";
}

void readEndpoint(const json &node, const std::string &role,
                  ConnectionParams &params) {
  if (!node.is_object())
    return;

  if (node.contains("host")) {
    std::string host = node["host"].get<std::string>();
    if (!host.empty())
      params.host = host;
  }
  if (node.contains("port")) {
    std::string port = portToString(node["port"]);
    if (!validateAndSetPort(port, params.port)) {
      Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                      "Invalid " + role + " port: " + port +
                          ", using default: " + params.port);
    }
  }
  if (node.contains("database"))
    params.database = node["database"].get<std::string>();
  if (node.contains("user"))
    params.user = node["user"].get<std::string>();
  if (node.contains("password"))
    params.password = node["password"].get<std::string>();
  if (node.contains("schema")) {
    std::string schema = node["schema"].get<std::string>();
    if (!schema.empty())
      params.schema = schema;
  }
  if (node.contains("connect_timeout"))
    params.connectTimeoutSeconds = node["connect_timeout"].get<int>();
}

void readEndpointEnv(const std::string &prefix, ConnectionParams &params) {
  auto env = [&prefix](const char *suffix) -> const char * {
    return std::getenv((prefix + suffix).c_str());
  };

  const char *host = env("HOST");
  const char *port = env("PORT");
  const char *db = env("DB");
  const char *user = env("USER");
  const char *password = env("PASSWORD");
  const char *schema = env("SCHEMA");

  if (host && strlen(host) > 0)
    params.host = host;
  if (port && strlen(port) > 0) {
    std::string portStr(port);
    if (!validateAndSetPort(portStr, params.port)) {
      Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                      "Invalid port in " + prefix + "PORT: " + portStr);
    }
  }
  if (db && strlen(db) > 0)
    params.database = db;
  if (user && strlen(user) > 0)
    params.user = user;
  if (password)
    params.password = password;
  if (schema && strlen(schema) > 0)
    params.schema = schema;
}

template <typename Setter>
void applySetting(const json &node, const char *key, Setter setter) {
  if (!node.contains(key))
    return;
  try {
    setter(node[key].get<size_t>());
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                    "Ignoring " + std::string(key) + ": " + e.what());
  }
}
} // namespace

void MigrationConfig::loadFromEnvUnlocked() {
  readEndpointEnv("SOURCE_PG_", source_);
  readEndpointEnv("TARGET_PG_", target_);

  if (source_.password.empty() || target_.password.empty()) {
    Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                    "Source or target password is empty. "
                    "Connections may fail.");
  }
  initialized_ = true;
}

void MigrationConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

void MigrationConfig::reset() {
  std::lock_guard<std::mutex> lock(configMutex_);
  source_ = ConnectionParams{};
  target_ = ConnectionParams{};
  tables_.clear();
  allTables_ = false;
  rowCountHints_ = true;
  reportFile_.clear();
  logging_ = LoggingSettings{};
  initialized_ = false;
  MigrationSettings::resetDefaults();
}

bool MigrationConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults and environment variables");
    loadFromEnv();
    return false;
  }

  std::string text((std::istreambuf_iterator<char>(configFile)),
                   std::istreambuf_iterator<char>());
  return loadFromString(text);
}

bool MigrationConfig::loadFromString(const std::string &jsonText) {
  std::lock_guard<std::mutex> lock(configMutex_);

  try {
    json config = json::parse(jsonText);

    if (config.contains("source"))
      readEndpoint(config["source"], "source", source_);
    if (config.contains("target"))
      readEndpoint(config["target"], "target", target_);

    if (config.contains("migration")) {
      const json &migration = config["migration"];
      if (migration.contains("tables")) {
        tables_ = migration["tables"].get<std::vector<std::string>>();
      }
      if (migration.contains("all_tables"))
        allTables_ = migration["all_tables"].get<bool>();
      if (migration.contains("row_count_hints"))
        rowCountHints_ = migration["row_count_hints"].get<bool>();
      if (migration.contains("report_file"))
        reportFile_ = migration["report_file"].get<std::string>();

      applySetting(migration, "batch_size", MigrationSettings::setBatchSize);
      applySetting(migration, "max_workers", MigrationSettings::setMaxWorkers);
      applySetting(migration, "progress_interval_ms",
                   MigrationSettings::setProgressInterval);
    }

    if (config.contains("logging")) {
      const json &logging = config["logging"];
      if (logging.contains("level"))
        logging_.level = logging["level"].get<std::string>();
      if (logging.contains("console"))
        logging_.console = logging["console"].get<bool>();
      if (logging.contains("file"))
        logging_.file = logging["file"].get<std::string>();
      if (logging.contains("max_file_size"))
        logging_.maxFileSize = logging["max_file_size"].get<size_t>();
      if (logging.contains("max_backup_files"))
        logging_.maxBackupFiles = logging["max_backup_files"].get<int>();
    }

    loadFromEnvUnlocked();
    return true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CONFIG, "MigrationConfig",
                  "Error loading config: " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnvUnlocked();
    return false;
  }
}
