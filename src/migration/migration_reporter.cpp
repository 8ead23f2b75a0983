#include "migration/migration_reporter.h"
#include "core/logger.h"
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

std::string MigrationReporter::formatBytes(double bytes) {
  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  while (bytes >= 1024 && unit < 4) {
    bytes /= 1024;
    unit++;
  }
  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%.2f %s", bytes, units[unit]);
  return std::string(buffer);
}

std::string MigrationReporter::formatDuration(double seconds) {
  if (seconds < 1.0) {
    return std::to_string(static_cast<int>(seconds * 1000.0)) + "ms";
  }
  if (seconds < 60.0) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.2fs", seconds);
    return std::string(buffer);
  }
  int minutes = static_cast<int>(seconds) / 60;
  int secs = static_cast<int>(seconds) % 60;
  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%dm %02ds", minutes, secs);
  return std::string(buffer);
}

std::string MigrationReporter::formatTimestamp(const TimePoint &time) {
  auto time_t = Clock::to_time_t(time);
  struct tm tm_buf;
  gmtime_r(&time_t, &tm_buf);
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

void MigrationReporter::printProgress(std::ostream &out,
                                      const MigrationReport &report) {
  size_t total = report.tables.size();
  size_t done = report.countByStatus(TableStatus::SUCCEEDED) +
                report.countByStatus(TableStatus::FAILED) +
                report.countByStatus(TableStatus::CANCELLED);
  double progress =
      total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 0.0;
  int progressBars = static_cast<int>(progress * 30.0);

  out << "\r\033[K█ Migration | ";
  for (int i = 0; i < 30; ++i) {
    out << (i < progressBars ? "█" : "░");
  }
  out << " " << static_cast<int>(progress * 100.0) << "% | " << done << "/"
      << total << " tables | running "
      << report.countByStatus(TableStatus::RUNNING) << " | failed "
      << report.countByStatus(TableStatus::FAILED) << " | "
      << report.totalRows << " rows | "
      << formatBytes(static_cast<double>(report.totalBytes)) << std::flush;
}

void MigrationReporter::printSummary(std::ostream &out,
                                     const MigrationReport &report) {
  size_t succeeded = report.countByStatus(TableStatus::SUCCEEDED);
  size_t failed = report.countByStatus(TableStatus::FAILED);
  size_t cancelled = report.countByStatus(TableStatus::CANCELLED);
  size_t pending = report.countByStatus(TableStatus::PENDING);

  out << "\n\n█ MIGRATION REPORT " << report.jobId << "\n";
  out << "=====================================\n";
  out << "Status: " << jobStatusToString(report.overallStatus()) << "\n";
  out << "Succeeded: " << succeeded << "/" << report.tables.size()
      << " | Failed: " << failed << " | Cancelled: " << cancelled
      << " | Not started: " << pending << "\n";
  out << "Rows: " << report.totalRows << " | Data: "
      << formatBytes(static_cast<double>(report.totalBytes))
      << " | Time: " << formatDuration(report.elapsedSeconds()) << "\n\n";

  for (const auto &table : report.tables) {
    out << "  " << std::left << std::setw(10)
        << tableStatusToString(table.status) << " " << table.tableName << ": "
        << table.rowsMigrated << " rows";
    if (table.startedAt)
      out << " in " << formatDuration(table.durationSeconds());
    out << "\n";
  }

  if (failed > 0) {
    out << "\nError details:\n";
    for (const auto &table : report.tables) {
      if (table.status == TableStatus::FAILED && table.errorDetail) {
        out << "  " << table.tableName << ": " << *table.errorDetail << "\n";
      }
    }
  }
  out << std::flush;
}

json MigrationReporter::toJson(const TableResult &table) {
  json node;
  node["table"] = table.tableName;
  node["status"] = tableStatusToString(table.status);
  node["rows_migrated"] = table.rowsMigrated;
  node["bytes_migrated"] = table.bytesMigrated;
  node["batches"] = table.batchesCompleted;
  node["time_taken"] = table.durationSeconds();
  node["row_count_hint"] =
      table.rowCountHint ? json(*table.rowCountHint) : json(nullptr);
  node["started_at"] =
      table.startedAt ? json(formatTimestamp(*table.startedAt)) : json(nullptr);
  node["finished_at"] = table.finishedAt
                            ? json(formatTimestamp(*table.finishedAt))
                            : json(nullptr);
  node["error"] = table.errorDetail ? json(*table.errorDetail) : json(nullptr);
  return node;
}

json MigrationReporter::toJson(const MigrationReport &report) {
  json doc;
  doc["job_id"] = report.jobId;
  doc["status"] = jobStatusToString(report.overallStatus());
  doc["cancel_requested"] = report.cancelRequested;
  doc["total_rows"] = report.totalRows;
  doc["total_bytes"] = report.totalBytes;
  doc["elapsed_seconds"] = report.elapsedSeconds();
  doc["succeeded"] = report.countByStatus(TableStatus::SUCCEEDED);
  doc["failed"] = report.countByStatus(TableStatus::FAILED);
  doc["cancelled"] = report.countByStatus(TableStatus::CANCELLED);
  doc["pending"] = report.countByStatus(TableStatus::PENDING);
  doc["tables"] = json::array();
  for (const auto &table : report.tables) {
    doc["tables"].push_back(toJson(table));
  }
  return doc;
}

bool MigrationReporter::writeJson(const std::string &path,
                                  const MigrationReport &report) {
  std::ofstream file(path);
  if (!file.is_open()) {
    Logger::error(LogCategory::SYSTEM, "MigrationReporter",
                  "Could not open report file " + path);
    return false;
  }
  file << toJson(report).dump(2) << '\n';
  return file.good();
}
