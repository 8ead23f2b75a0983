#include "migration/migration_service.h"
#include "core/errors.h"
#include "core/logger.h"
#include <chrono>

MigrationHandle::MigrationHandle(
    std::string jobId, std::unique_ptr<MigrationOrchestrator> orchestrator)
    : jobId_(std::move(jobId)), orchestrator_(std::move(orchestrator)) {}

MigrationHandle::~MigrationHandle() {
  std::lock_guard<std::mutex> joinLock(joinMutex_);
  if (runner_.joinable()) {
    if (!finished_.load())
      orchestrator_->cancel();
    runner_.join();
  }
}

void MigrationHandle::start(MigrationJob job) {
  runner_ = std::thread([this, job = std::move(job)]() {
    try {
      MigrationReport report = orchestrator_->run(job);
      std::lock_guard<std::mutex> lock(resultMutex_);
      finalReport_ = std::move(report);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::TRANSFER, "MigrationHandle",
                    "Job " + jobId_ + " aborted: " + std::string(e.what()));
      std::lock_guard<std::mutex> lock(resultMutex_);
      failure_ = std::current_exception();
    }
    finished_.store(true);
  });
}

MigrationReport MigrationHandle::snapshot() const {
  return orchestrator_->snapshot();
}

void MigrationHandle::cancel() { orchestrator_->cancel(); }

MigrationReport MigrationHandle::wait() {
  {
    std::lock_guard<std::mutex> joinLock(joinMutex_);
    if (runner_.joinable()) {
      runner_.join();
    }
  }

  std::lock_guard<std::mutex> lock(resultMutex_);
  if (failure_) {
    std::rethrow_exception(failure_);
  }
  if (finalReport_) {
    return *finalReport_;
  }
  return orchestrator_->snapshot();
}

MigrationService::MigrationService(IConnectionProvider &provider)
    : provider_(provider) {}

std::string MigrationService::nextJobId() {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                     Clock::now().time_since_epoch())
                     .count();
  return "job-" + std::to_string(seconds) + "-" +
         std::to_string(++jobCounter_);
}

std::shared_ptr<ISession>
MigrationService::openSession(const ConnectionParams &params,
                              const std::string &role) {
  Logger::info(LogCategory::DATABASE, "MigrationService",
               "Connecting to " + role + " " + params.toLogString());
  std::shared_ptr<ISession> session = provider_.connect(params);
  if (!session) {
    throw ConnectionError(params.toLogString(), "provider returned no session");
  }
  provider_.testConnection(*session);
  return session;
}

void MigrationService::testConnection(const ConnectionParams &params) {
  openSession(params, "endpoint");
  Logger::info(LogCategory::DATABASE, "MigrationService",
               "Connection to " + params.toLogString() + " OK");
}

std::vector<std::string>
MigrationService::listTables(const ConnectionParams &params) {
  auto session = openSession(params, "source");
  return provider_.listTables(*session);
}

void MigrationService::validate(const MigrationRequest &request) {
  if (!request.allTables && request.tables.empty()) {
    throw InvalidJobConfig("table list is empty");
  }
  if (request.batchSize < 1) {
    throw InvalidJobConfig("batch size must be at least 1");
  }
  if (request.concurrency < 1) {
    throw InvalidJobConfig("concurrency must be at least 1");
  }
}

std::shared_ptr<MigrationHandle>
MigrationService::submit(const MigrationRequest &request) {
  validate(request);

  MigrationJob job;
  job.jobId = nextJobId();
  job.batchSize = request.batchSize;
  job.concurrency = request.concurrency;
  job.source = openSession(request.source, "source");
  job.target = openSession(request.target, "target");

  std::vector<std::string> names = request.tables;
  if (request.allTables) {
    names = provider_.listTables(*job.source);
    Logger::info(LogCategory::TRANSFER, "MigrationService",
                 "Found " + std::to_string(names.size()) +
                     " tables in source schema");
  }

  for (const auto &name : names) {
    TableSpec spec;
    spec.name = name;
    if (request.fetchRowCountHints) {
      spec.rowCountHint = provider_.countRows(*job.source, name);
    }
    job.tables.push_back(std::move(spec));
  }

  auto orchestrator = std::make_unique<MigrationOrchestrator>(provider_);
  orchestrator->prepare(job);

  auto handle =
      std::make_shared<MigrationHandle>(job.jobId, std::move(orchestrator));
  handle->start(std::move(job));
  return handle;
}
