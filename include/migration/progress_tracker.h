#ifndef PROGRESS_TRACKER_H
#define PROGRESS_TRACKER_H

#include "migration/migration_types.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Shared per-job progress state. Every Table Migrator of a job writes into the
// same tracker; each table is written by exactly one migrator. Aggregate
// totals are updated under the same lock as the per-table counters so a
// snapshot always sees totals equal to the per-table sums.
class ProgressTracker {
public:
  ProgressTracker() = default;

  ProgressTracker(const ProgressTracker &) = delete;
  ProgressTracker &operator=(const ProgressTracker &) = delete;

  void registerTables(const std::string &jobId,
                      const std::vector<TableSpec> &tables);

  bool begin(const std::string &tableName);
  bool record(const std::string &tableName, int64_t rowsInBatch,
              int64_t bytesInBatch);
  bool status(const std::string &tableName, TableStatus newStatus,
              const std::string &errorDetail = "");

  void markCancelRequested();
  void markFinished();

  MigrationReport snapshot() const;
  TableResult result(const std::string &tableName) const;

  size_t runningCount() const;
  size_t peakRunning() const;

private:
  TableResult *findUnlocked(const std::string &tableName);

  mutable std::mutex mutex_;
  MigrationReport report_;
  std::unordered_map<std::string, size_t> index_;
  size_t running_ = 0;
  size_t peakRunning_ = 0;
};

#endif
