#ifndef MIGRATION_TYPES_H
#define MIGRATION_TYPES_H

#include "engines/connection_provider.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class TableStatus { PENDING, RUNNING, SUCCEEDED, FAILED, CANCELLED };

enum class JobStatus { PENDING, RUNNING, SUCCEEDED, FAILED, CANCELLED };

std::string tableStatusToString(TableStatus status);
TableStatus tableStatusFromString(const std::string &text);
std::string jobStatusToString(JobStatus status);

inline bool isTerminal(TableStatus status) {
  return status == TableStatus::SUCCEEDED || status == TableStatus::FAILED ||
         status == TableStatus::CANCELLED;
}

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct TableSpec {
  std::string name;
  std::optional<int64_t> rowCountHint;
};

struct MigrationJob {
  std::string jobId;
  std::shared_ptr<ISession> source;
  std::shared_ptr<ISession> target;
  std::vector<TableSpec> tables;
  size_t batchSize = 0;
  size_t concurrency = 0;
};

struct TableResult {
  std::string tableName;
  TableStatus status = TableStatus::PENDING;
  int64_t rowsMigrated = 0;
  int64_t bytesMigrated = 0;
  size_t batchesCompleted = 0;
  std::optional<int64_t> rowCountHint;
  std::optional<TimePoint> startedAt;
  std::optional<TimePoint> finishedAt;
  // Set iff status is FAILED.
  std::optional<std::string> errorDetail;

  double durationSeconds() const;
  // 0..100 from the row-count hint; std::nullopt without a hint.
  std::optional<double> percentComplete() const;
};

struct MigrationReport {
  std::string jobId;
  std::vector<TableResult> tables;
  int64_t totalRows = 0;
  int64_t totalBytes = 0;
  bool cancelRequested = false;
  std::optional<TimePoint> startedAt;
  std::optional<TimePoint> finishedAt;

  const TableResult *find(const std::string &tableName) const;
  size_t countByStatus(TableStatus status) const;
  bool isComplete() const;
  JobStatus overallStatus() const;
  double elapsedSeconds() const;
};

#endif
