#include "migration/migration_orchestrator.h"
#include "core/errors.h"
#include "core/logger.h"
#include "migration/table_migrator.h"
#include "migration/table_worker_pool.h"
#include <algorithm>
#include <unordered_set>

MigrationOrchestrator::MigrationOrchestrator(IConnectionProvider &provider)
    : provider_(provider) {}

void MigrationOrchestrator::validate(const MigrationJob &job) {
  if (job.tables.empty()) {
    throw InvalidJobConfig("table list is empty");
  }
  if (job.batchSize < 1) {
    throw InvalidJobConfig("batch size must be at least 1");
  }
  if (job.concurrency < 1) {
    throw InvalidJobConfig("concurrency must be at least 1");
  }
  if (!job.source || !job.target) {
    throw InvalidJobConfig("source and target sessions are required");
  }

  std::unordered_set<std::string> seen;
  for (const auto &table : job.tables) {
    if (table.name.empty()) {
      throw InvalidJobConfig("table name must not be empty");
    }
    if (!seen.insert(table.name).second) {
      throw InvalidJobConfig("table " + table.name + " listed more than once");
    }
  }
}

void MigrationOrchestrator::registerJob(const MigrationJob &job) {
  tracker_.registerTables(job.jobId, job.tables);
  if (cancelToken_.isCancelled()) {
    tracker_.markCancelRequested();
  }
}

void MigrationOrchestrator::prepare(const MigrationJob &job) {
  validate(job);
  if (running_.load()) {
    throw InvalidJobConfig("orchestrator is already running job " +
                           tracker_.snapshot().jobId);
  }
  registerJob(job);
  prepared_.store(true);
}

MigrationReport MigrationOrchestrator::run(const MigrationJob &job) {
  validate(job);

  if (running_.exchange(true)) {
    throw InvalidJobConfig("orchestrator is already running job " +
                           tracker_.snapshot().jobId);
  }

  const MigrationJob frozen = job;
  if (!prepared_.exchange(false) ||
      tracker_.snapshot().jobId != frozen.jobId) {
    registerJob(frozen);
  }

  size_t workers = std::min(frozen.concurrency, frozen.tables.size());
  Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
               "Job " + frozen.jobId + ": migrating " +
                   std::to_string(frozen.tables.size()) + " tables from " +
                   frozen.source->endpoint() + " to " +
                   frozen.target->endpoint() + " (batch size " +
                   std::to_string(frozen.batchSize) + ", " +
                   std::to_string(workers) + " workers)");

  TableMigrator migrator(provider_, tracker_, cancelToken_);
  ISession &source = *frozen.source;
  ISession &target = *frozen.target;
  const size_t batchSize = frozen.batchSize;

  {
    TableWorkerPool pool(workers,
                         [this] { return !cancelToken_.isCancelled(); });

    for (const auto &table : frozen.tables) {
      pool.submitTask(table, [this, &migrator, &source, &target,
                              batchSize](const TableSpec &spec) {
        try {
          migrator.migrate(spec, source, target, batchSize);
        } catch (const std::exception &e) {
          Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                        "Table " + spec.name +
                            " aborted: " + std::string(e.what()));
          tracker_.status(spec.name, TableStatus::FAILED, e.what());
        } catch (...) {
          Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                        "Table " + spec.name + " aborted: unknown exception");
          tracker_.status(spec.name, TableStatus::FAILED,
                          "unknown exception");
        }
      });
    }

    pool.waitForCompletion();
  }

  tracker_.markFinished();
  MigrationReport report = tracker_.snapshot();

  Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
               "Job " + report.jobId + " " +
                   jobStatusToString(report.overallStatus()) + ": " +
                   std::to_string(report.countByStatus(TableStatus::SUCCEEDED)) +
                   " succeeded, " +
                   std::to_string(report.countByStatus(TableStatus::FAILED)) +
                   " failed, " +
                   std::to_string(report.countByStatus(TableStatus::CANCELLED)) +
                   " cancelled, " +
                   std::to_string(report.countByStatus(TableStatus::PENDING)) +
                   " not started, " + std::to_string(report.totalRows) +
                   " rows");
  return report;
}

MigrationReport MigrationOrchestrator::snapshot() const {
  return tracker_.snapshot();
}

void MigrationOrchestrator::cancel() {
  if (cancelToken_.isCancelled())
    return;
  cancelToken_.cancel();
  tracker_.markCancelRequested();
  Logger::warning(LogCategory::TRANSFER, "MigrationOrchestrator",
                  "Cancellation requested");
}
