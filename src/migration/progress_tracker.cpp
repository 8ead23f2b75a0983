#include "migration/progress_tracker.h"
#include "core/logger.h"
#include <stdexcept>

void ProgressTracker::registerTables(const std::string &jobId,
                                     const std::vector<TableSpec> &tables) {
  std::lock_guard<std::mutex> lock(mutex_);
  report_ = MigrationReport{};
  report_.jobId = jobId;
  report_.startedAt = Clock::now();
  index_.clear();
  running_ = 0;
  peakRunning_ = 0;

  report_.tables.reserve(tables.size());
  for (const auto &spec : tables) {
    TableResult result;
    result.tableName = spec.name;
    result.rowCountHint = spec.rowCountHint;
    index_[spec.name] = report_.tables.size();
    report_.tables.push_back(std::move(result));
  }
}

TableResult *ProgressTracker::findUnlocked(const std::string &tableName) {
  auto it = index_.find(tableName);
  if (it == index_.end())
    return nullptr;
  return &report_.tables[it->second];
}

bool ProgressTracker::begin(const std::string &tableName) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableResult *table = findUnlocked(tableName);
  if (!table) {
    Logger::warning(LogCategory::PROGRESS, "ProgressTracker::begin",
                    "Unknown table: " + tableName);
    return false;
  }
  if (table->status != TableStatus::PENDING) {
    Logger::warning(LogCategory::PROGRESS, "ProgressTracker::begin",
                    "Table " + tableName + " is already " +
                        tableStatusToString(table->status));
    return false;
  }

  table->status = TableStatus::RUNNING;
  table->startedAt = Clock::now();
  running_++;
  if (running_ > peakRunning_)
    peakRunning_ = running_;
  return true;
}

bool ProgressTracker::record(const std::string &tableName, int64_t rowsInBatch,
                             int64_t bytesInBatch) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableResult *table = findUnlocked(tableName);
  if (!table || table->status != TableStatus::RUNNING) {
    Logger::warning(LogCategory::PROGRESS, "ProgressTracker::record",
                    "Ignoring batch for table not running: " + tableName);
    return false;
  }

  table->rowsMigrated += rowsInBatch;
  table->bytesMigrated += bytesInBatch;
  table->batchesCompleted++;
  report_.totalRows += rowsInBatch;
  report_.totalBytes += bytesInBatch;
  return true;
}

// Applies a terminal transition. Only RUNNING tables may finish, except that
// a PENDING table may fail directly (a migrator that could not start).
bool ProgressTracker::status(const std::string &tableName,
                             TableStatus newStatus,
                             const std::string &errorDetail) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableResult *table = findUnlocked(tableName);
  if (!table) {
    Logger::warning(LogCategory::PROGRESS, "ProgressTracker::status",
                    "Unknown table: " + tableName);
    return false;
  }

  if (!isTerminal(newStatus)) {
    Logger::warning(LogCategory::PROGRESS, "ProgressTracker::status",
                    "Non-terminal status " + tableStatusToString(newStatus) +
                        " requested for " + tableName);
    return false;
  }

  bool allowed = table->status == TableStatus::RUNNING ||
                 (table->status == TableStatus::PENDING &&
                  newStatus == TableStatus::FAILED);
  if (!allowed) {
    Logger::warning(LogCategory::PROGRESS, "ProgressTracker::status",
                    "Illegal transition for " + tableName + ": " +
                        tableStatusToString(table->status) + " -> " +
                        tableStatusToString(newStatus));
    return false;
  }

  if (table->status == TableStatus::RUNNING)
    running_--;

  table->status = newStatus;
  table->finishedAt = Clock::now();
  if (newStatus == TableStatus::FAILED) {
    table->errorDetail = errorDetail.empty() ? "unknown error" : errorDetail;
  }
  return true;
}

void ProgressTracker::markCancelRequested() {
  std::lock_guard<std::mutex> lock(mutex_);
  report_.cancelRequested = true;
}

void ProgressTracker::markFinished() {
  std::lock_guard<std::mutex> lock(mutex_);
  report_.finishedAt = Clock::now();
}

MigrationReport ProgressTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return report_;
}

TableResult ProgressTracker::result(const std::string &tableName) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(tableName);
  if (it == index_.end())
    throw std::out_of_range("Unknown table: " + tableName);
  return report_.tables[it->second];
}

size_t ProgressTracker::runningCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

size_t ProgressTracker::peakRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peakRunning_;
}
