#ifndef MIGRATION_SERVICE_H
#define MIGRATION_SERVICE_H

#include "engines/connection_provider.h"
#include "migration/migration_orchestrator.h"
#include "migration/migration_types.h"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct MigrationRequest {
  ConnectionParams source;
  ConnectionParams target;
  // Ignored when allTables is set; the source schema is listed instead.
  std::vector<std::string> tables;
  bool allTables = false;
  size_t batchSize = 0;
  size_t concurrency = 0;
  bool fetchRowCountHints = true;
};

// Caller-side view of a running job: poll snapshot(), request cancel(), or
// block in wait() for the final report.
class MigrationHandle {
private:
  std::string jobId_;
  std::unique_ptr<MigrationOrchestrator> orchestrator_;
  std::thread runner_;
  std::atomic<bool> finished_{false};
  std::mutex joinMutex_;
  std::mutex resultMutex_;
  std::optional<MigrationReport> finalReport_;
  std::exception_ptr failure_;

public:
  MigrationHandle(std::string jobId,
                  std::unique_ptr<MigrationOrchestrator> orchestrator);
  ~MigrationHandle();

  MigrationHandle(const MigrationHandle &) = delete;
  MigrationHandle &operator=(const MigrationHandle &) = delete;

  void start(MigrationJob job);

  const std::string &jobId() const { return jobId_; }
  MigrationReport snapshot() const;
  void cancel();
  bool isFinished() const { return finished_.load(); }

  // Blocks until the job ends. Rethrows a job-level error raised on the
  // runner thread.
  MigrationReport wait();
};

class MigrationService {
private:
  IConnectionProvider &provider_;
  std::atomic<size_t> jobCounter_{0};

  std::shared_ptr<ISession> openSession(const ConnectionParams &params,
                                        const std::string &role);
  std::string nextJobId();

public:
  explicit MigrationService(IConnectionProvider &provider);

  // Throws ConnectionError.
  void testConnection(const ConnectionParams &params);
  // Throws ConnectionError or ReadError.
  std::vector<std::string> listTables(const ConnectionParams &params);

  // Validates the request (InvalidJobConfig), opens and tests both endpoints
  // (ConnectionError) and starts the job on a background thread.
  std::shared_ptr<MigrationHandle> submit(const MigrationRequest &request);

  static void validate(const MigrationRequest &request);
};

#endif
