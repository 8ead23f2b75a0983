#ifndef MIGRATION_CONFIG_H
#define MIGRATION_CONFIG_H

#include "core/logger.h"
#include "engines/connection_provider.h"
#include <mutex>
#include <string>
#include <vector>

// Endpoints, table selection and logging for the command-line tool. Values
// come from a JSON file; anything the file leaves out can be supplied through
// SOURCE_PG_* / TARGET_PG_* environment variables. Batch size, worker count
// and poll interval are pushed into MigrationSettings.
class MigrationConfig {
private:
  static ConnectionParams source_;
  static ConnectionParams target_;
  static std::vector<std::string> tables_;
  static bool allTables_;
  static bool rowCountHints_;
  static std::string reportFile_;
  static LoggingSettings logging_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void loadFromEnvUnlocked();

public:
  // Returns false when the file is missing or malformed; defaults and
  // environment variables are applied in either case.
  static bool loadFromFile(const std::string &configPath = "config.json");
  static bool loadFromString(const std::string &jsonText);
  static void loadFromEnv();
  static void reset();

  static ConnectionParams getSource() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return source_;
  }
  static ConnectionParams getTarget() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return target_;
  }
  static std::vector<std::string> getTables() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return tables_;
  }
  static bool getAllTables() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return allTables_;
  }
  static bool getRowCountHints() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return rowCountHints_;
  }
  static std::string getReportFile() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return reportFile_;
  }
  static LoggingSettings getLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return logging_;
  }
  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
