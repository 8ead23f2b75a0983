#ifndef MIGRATION_REPORTER_H
#define MIGRATION_REPORTER_H

#include "migration/migration_types.h"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

class MigrationReporter {
public:
  // Single self-overwriting line for a terminal poll loop.
  static void printProgress(std::ostream &out, const MigrationReport &report);
  static void printSummary(std::ostream &out, const MigrationReport &report);

  static nlohmann::json toJson(const MigrationReport &report);
  static nlohmann::json toJson(const TableResult &table);
  static bool writeJson(const std::string &path, const MigrationReport &report);

  static std::string formatBytes(double bytes);
  static std::string formatDuration(double seconds);
  static std::string formatTimestamp(const TimePoint &time);
};

#endif
