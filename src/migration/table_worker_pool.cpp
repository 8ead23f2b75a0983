#include "migration/table_worker_pool.h"
#include "core/logger.h"

TableWorkerPool::TableWorkerPool(size_t numWorkers,
                                 std::function<bool()> admissionOpen)
    : admissionOpen_(std::move(admissionOpen)) {
  if (numWorkers == 0) {
    numWorkers = 1;
    Logger::warning(LogCategory::TRANSFER, "TableWorkerPool",
                    "numWorkers was 0, using a single worker");
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&TableWorkerPool::workerThread, this, i);
  }

  Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                "Created pool with " + std::to_string(numWorkers) +
                    " workers");
}

TableWorkerPool::~TableWorkerPool() { shutdown(); }

// Takes tables until the queue drains or the admission gate closes. The
// processor is expected to record its own failures; an exception reaching
// this loop is counted and logged so it cannot take the worker down.
void TableWorkerPool::workerThread(size_t workerId) {
  const std::string worker = "Worker #" + std::to_string(workerId);

  while (!shutdown_.load()) {
    if (admissionOpen_ && !admissionOpen_()) {
      Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                    worker + " stopping: admission closed");
      break;
    }

    TableTask task;
    if (!tasks_.popBlocking(task)) {
      break;
    }

    if (admissionOpen_ && !admissionOpen_()) {
      // Closed while this worker was waiting; the table stays unstarted.
      break;
    }

    activeWorkers_++;

    try {
      Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                    worker + " processing table: " + task.table.name);

      task.processor(task.table);
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::TRANSFER, "TableWorkerPool",
                    worker + " failed processing table: " + task.table.name +
                        " - Error: " + std::string(e.what()));
    } catch (...) {
      failedTasks_++;
      Logger::error(LogCategory::TRANSFER, "TableWorkerPool",
                    worker + " failed processing table: " + task.table.name +
                        " - unknown exception");
    }

    activeWorkers_--;
  }
}

void TableWorkerPool::submitTask(
    const TableSpec &table, std::function<void(const TableSpec &)> processor) {
  if (shutdown_.load()) {
    Logger::warning(LogCategory::TRANSFER, "TableWorkerPool",
                    "Cannot submit task - pool is shutting down: " +
                        table.name);
    return;
  }

  tasks_.push(TableTask{table, std::move(processor)});
  totalTasksSubmitted_++;
}

void TableWorkerPool::waitForCompletion() {
  tasks_.finish();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                "All workers finished - Completed: " +
                    std::to_string(completedTasks_.load()) + " | Failed: " +
                    std::to_string(failedTasks_.load()) + " | Not started: " +
                    std::to_string(tasks_.size()));
}

// Idempotent. Queued tables that were never taken are discarded.
void TableWorkerPool::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  tasks_.finish();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}
