#ifndef MIGRATION_ORCHESTRATOR_H
#define MIGRATION_ORCHESTRATOR_H

#include "engines/connection_provider.h"
#include "migration/cancellation_token.h"
#include "migration/migration_types.h"
#include "migration/progress_tracker.h"
#include <atomic>
#include <mutex>

// Runs the Table Migrators of one job under a bounded worker pool. Tables are
// admitted in input order; a table's failure never stops its siblings. The
// orchestrator owns the job's ProgressTracker and CancellationToken and hands
// both to every migrator it starts.
class MigrationOrchestrator {
private:
  IConnectionProvider &provider_;
  ProgressTracker tracker_;
  CancellationToken cancelToken_;
  std::atomic<bool> running_{false};
  std::atomic<bool> prepared_{false};

  void registerJob(const MigrationJob &job);

public:
  explicit MigrationOrchestrator(IConnectionProvider &provider);

  MigrationOrchestrator(const MigrationOrchestrator &) = delete;
  MigrationOrchestrator &operator=(const MigrationOrchestrator &) = delete;

  // Validates the job and lists its tables as PENDING so snapshot() shows
  // every table before run() starts. Optional; run() does the same when it
  // was not called. Throws InvalidJobConfig.
  void prepare(const MigrationJob &job);

  // Throws InvalidJobConfig before any table is started. One orchestrator
  // runs one job.
  MigrationReport run(const MigrationJob &job);

  // Point-in-time copy; safe to call from any thread, including mid-run.
  MigrationReport snapshot() const;

  // Stops admitting tables and asks running migrators to stop at their next
  // batch boundary. Returns immediately.
  void cancel();
  bool isCancelled() const { return cancelToken_.isCancelled(); }

  // Most tables seen RUNNING at the same time during run().
  size_t peakRunning() const { return tracker_.peakRunning(); }

  static void validate(const MigrationJob &job);
};

#endif
