#include "core/errors.h"
#include "core/logger.h"
#include "core/migration_config.h"
#include "core/migration_settings.h"
#include "engines/postgres_provider.h"
#include "migration/migration_reporter.h"
#include "migration/migration_service.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_TABLES_FAILED = 1;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_CANCELLED = 3;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void printUsage() {
  std::cout << "Usage: datamigrate [config.json] [--test | --list]\n"
               "  --test  check source and target connections and exit\n"
               "  --list  list the tables of the source schema and exit\n";
}

int testConnections(MigrationService &service) {
  int rc = EXIT_SUCCESS_CODE;
  for (const auto &[role, params] :
       {std::make_pair(std::string("source"), MigrationConfig::getSource()),
        std::make_pair(std::string("target"), MigrationConfig::getTarget())}) {
    try {
      service.testConnection(params);
      std::cout << role << " " << params.toLogString() << ": OK\n";
    } catch (const ConnectionError &e) {
      std::cout << role << " " << params.toLogString() << ": FAILED ("
                << e.what() << ")\n";
      rc = EXIT_INIT_ERROR;
    }
  }
  return rc;
}

int listTables(MigrationService &service) {
  try {
    auto tables = service.listTables(MigrationConfig::getSource());
    for (const auto &table : tables) {
      std::cout << table << "\n";
    }
    std::cout << "Found " << tables.size() << " tables\n";
    return EXIT_SUCCESS_CODE;
  } catch (const MigrationError &e) {
    std::cerr << "Error listing tables: " << e.what() << std::endl;
    return EXIT_INIT_ERROR;
  }
}

int runMigration(MigrationService &service) {
  MigrationRequest request;
  request.source = MigrationConfig::getSource();
  request.target = MigrationConfig::getTarget();
  request.tables = MigrationConfig::getTables();
  request.allTables = MigrationConfig::getAllTables();
  request.batchSize = MigrationSettings::getBatchSize();
  request.concurrency = MigrationSettings::getMaxWorkers();
  request.fetchRowCountHints = MigrationConfig::getRowCountHints();

  std::shared_ptr<MigrationHandle> handle;
  try {
    handle = service.submit(request);
  } catch (const InvalidJobConfig &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  } catch (const MigrationError &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_INIT_ERROR;
  }

  const auto interval =
      std::chrono::milliseconds(MigrationSettings::getProgressInterval());
  bool cancelSent = false;
  while (!handle->isFinished()) {
    if (g_shutdownRequested.load() && !cancelSent) {
      Logger::warning(LogCategory::SYSTEM, "main",
                      "Shutdown requested, finishing current batches");
      handle->cancel();
      cancelSent = true;
    }
    MigrationReporter::printProgress(std::cout, handle->snapshot());
    std::this_thread::sleep_for(interval);
  }

  MigrationReport report = handle->wait();
  MigrationReporter::printProgress(std::cout, report);
  MigrationReporter::printSummary(std::cout, report);

  std::string reportFile = MigrationConfig::getReportFile();
  if (!reportFile.empty()) {
    if (MigrationReporter::writeJson(reportFile, report)) {
      Logger::info(LogCategory::SYSTEM, "main",
                   "Report written to " + reportFile);
    }
  }

  switch (report.overallStatus()) {
  case JobStatus::SUCCEEDED:
    return EXIT_SUCCESS_CODE;
  case JobStatus::CANCELLED:
    return EXIT_CANCELLED;
  default:
    return EXIT_TABLES_FAILED;
  }
}
} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = "config.json";
  std::string mode = "migrate";

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--test") {
      mode = "test";
    } else if (arg == "--list") {
      mode = "list";
    } else if (arg == "--help" || arg == "-h") {
      printUsage();
      return EXIT_SUCCESS_CODE;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      printUsage();
      return EXIT_CONFIG_ERROR;
    } else {
      configPath = arg;
    }
  }

  MigrationConfig::loadFromFile(configPath);
  if (!MigrationConfig::isInitialized()) {
    std::cerr << "Error: configuration failed to initialize. "
                 "Please check "
              << configPath << " or environment variables." << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  Logger::initialize(MigrationConfig::getLogging());

  if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
    std::cerr << "Error: Failed to register SIGINT handler" << std::endl;
    Logger::shutdown();
    return EXIT_SIGNAL_ERROR;
  }

  if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    std::cerr << "Error: Failed to register SIGTERM handler" << std::endl;
    Logger::shutdown();
    return EXIT_SIGNAL_ERROR;
  }

  Logger::info(LogCategory::SYSTEM, "main",
               "datamigrate started (" + MigrationConfig::getSource().toLogString() +
                   " -> " + MigrationConfig::getTarget().toLogString() + ")");

  int rc = EXIT_SUCCESS_CODE;
  try {
    PostgreSQLConnectionProvider provider(MigrationSettings::getMaxWorkers());
    MigrationService service(provider);

    if (mode == "test") {
      rc = testConnections(service);
    } else if (mode == "list") {
      rc = listTables(service);
    } else {
      rc = runMigration(service);
    }
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     "Unhandled exception: " + std::string(e.what()));
    std::cerr << "Critical error: " << e.what() << std::endl;
    rc = EXIT_INIT_ERROR;
  }

  Logger::info(LogCategory::SYSTEM, "main",
               "datamigrate finished with exit code " + std::to_string(rc));
  Logger::shutdown();
  return rc;
}
