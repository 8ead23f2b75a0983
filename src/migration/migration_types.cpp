#include "migration/migration_types.h"
#include <algorithm>
#include <stdexcept>

std::string tableStatusToString(TableStatus status) {
  switch (status) {
  case TableStatus::PENDING:
    return "pending";
  case TableStatus::RUNNING:
    return "running";
  case TableStatus::SUCCEEDED:
    return "succeeded";
  case TableStatus::FAILED:
    return "failed";
  case TableStatus::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

TableStatus tableStatusFromString(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
  if (lower == "pending")
    return TableStatus::PENDING;
  if (lower == "running")
    return TableStatus::RUNNING;
  if (lower == "succeeded")
    return TableStatus::SUCCEEDED;
  if (lower == "failed")
    return TableStatus::FAILED;
  if (lower == "cancelled")
    return TableStatus::CANCELLED;
  throw std::invalid_argument("Unknown table status: " + text);
}

std::string jobStatusToString(JobStatus status) {
  switch (status) {
  case JobStatus::PENDING:
    return "pending";
  case JobStatus::RUNNING:
    return "running";
  case JobStatus::SUCCEEDED:
    return "succeeded";
  case JobStatus::FAILED:
    return "failed";
  case JobStatus::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

double TableResult::durationSeconds() const {
  if (!startedAt)
    return 0.0;
  TimePoint end = finishedAt ? *finishedAt : Clock::now();
  return std::chrono::duration<double>(end - *startedAt).count();
}

std::optional<double> TableResult::percentComplete() const {
  if (status == TableStatus::SUCCEEDED)
    return 100.0;
  if (!rowCountHint)
    return std::nullopt;
  if (*rowCountHint <= 0)
    return 0.0;
  double pct = 100.0 * static_cast<double>(rowsMigrated) /
               static_cast<double>(*rowCountHint);
  return std::min(pct, 100.0);
}

const TableResult *MigrationReport::find(const std::string &tableName) const {
  for (const auto &table : tables) {
    if (table.tableName == tableName)
      return &table;
  }
  return nullptr;
}

size_t MigrationReport::countByStatus(TableStatus status) const {
  return static_cast<size_t>(
      std::count_if(tables.begin(), tables.end(),
                    [status](const TableResult &t) { return t.status == status; }));
}

// A report without tables belongs to a job that has not been registered yet.
// A cancelled job never admits its remaining tables, so those stay PENDING
// and the report is still complete.
bool MigrationReport::isComplete() const {
  if (tables.empty())
    return false;
  if (countByStatus(TableStatus::RUNNING) > 0)
    return false;
  if (cancelRequested)
    return true;
  return countByStatus(TableStatus::PENDING) == 0;
}

JobStatus MigrationReport::overallStatus() const {
  if (tables.empty())
    return JobStatus::PENDING;

  size_t succeeded = countByStatus(TableStatus::SUCCEEDED);
  size_t pending = countByStatus(TableStatus::PENDING);

  if (succeeded == tables.size())
    return JobStatus::SUCCEEDED;
  if (!isComplete())
    return pending == tables.size() ? JobStatus::PENDING : JobStatus::RUNNING;
  if (countByStatus(TableStatus::FAILED) > 0)
    return JobStatus::FAILED;
  return JobStatus::CANCELLED;
}

double MigrationReport::elapsedSeconds() const {
  if (!startedAt)
    return 0.0;
  TimePoint end = finishedAt ? *finishedAt : Clock::now();
  return std::chrono::duration<double>(end - *startedAt).count();
}
