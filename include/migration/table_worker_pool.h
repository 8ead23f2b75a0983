#ifndef TABLE_WORKER_POOL_H
#define TABLE_WORKER_POOL_H

#include "migration/migration_types.h"
#include "utils/thread_safe_queue.h"
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

struct TableTask {
  TableSpec table;
  std::function<void(const TableSpec &)> processor;
};

// Fixed set of worker threads taking tables from a FIFO queue, one table per
// worker at a time. Before taking the next table a worker consults the
// admission gate; once the gate closes no further tables are started and the
// ones still queued are left untouched.
class TableWorkerPool {
private:
  std::vector<std::thread> workers_;
  ThreadSafeQueue<TableTask> tasks_;
  std::function<bool()> admissionOpen_;
  std::atomic<size_t> activeWorkers_{0};
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<size_t> totalTasksSubmitted_{0};
  std::atomic<bool> shutdown_{false};

  void workerThread(size_t workerId);

public:
  TableWorkerPool(size_t numWorkers, std::function<bool()> admissionOpen);
  ~TableWorkerPool();

  TableWorkerPool(const TableWorkerPool &) = delete;
  TableWorkerPool &operator=(const TableWorkerPool &) = delete;

  void submitTask(const TableSpec &table,
                  std::function<void(const TableSpec &)> processor);

  void waitForCompletion();
  void shutdown();

  size_t activeWorkers() const { return activeWorkers_.load(); }
  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t pendingTasks() const { return tasks_.size(); }
  size_t totalWorkers() const { return workers_.size(); }
};

#endif
