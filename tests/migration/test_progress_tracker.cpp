#include "migration/progress_tracker.h"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

void testRegisterStartsPending() {
  std::cout << "Testing ProgressTracker - registration...\n";

  ProgressTracker tracker;
  tracker.registerTables("job-1", {{"a", 100}, {"b", std::nullopt}});

  MigrationReport report = tracker.snapshot();
  assert(report.jobId == "job-1");
  assert(report.tables.size() == 2);
  assert(report.tables[0].tableName == "a");
  assert(report.tables[1].tableName == "b");
  assert(report.countByStatus(TableStatus::PENDING) == 2);
  assert(report.tables[0].rowCountHint && *report.tables[0].rowCountHint == 100);
  assert(report.overallStatus() == JobStatus::PENDING);

  std::cout << "✓ registration test passed\n";
}

void testTransitions() {
  std::cout << "Testing ProgressTracker - status transitions...\n";

  ProgressTracker tracker;
  tracker.registerTables("job", {{"a", std::nullopt}, {"b", std::nullopt}});

  assert(!tracker.record("a", 10, 100) && "PENDING table cannot record");
  assert(!tracker.status("a", TableStatus::SUCCEEDED) &&
         "PENDING table cannot succeed");

  assert(tracker.begin("a"));
  assert(!tracker.begin("a") && "begin twice must be rejected");
  assert(tracker.runningCount() == 1);

  assert(tracker.record("a", 10, 100));
  assert(tracker.record("a", 5, 50));
  assert(!tracker.status("a", TableStatus::RUNNING) &&
         "non-terminal status must be rejected");
  assert(tracker.status("a", TableStatus::SUCCEEDED));
  assert(tracker.runningCount() == 0);

  TableResult a = tracker.result("a");
  assert(a.status == TableStatus::SUCCEEDED);
  assert(a.rowsMigrated == 15);
  assert(a.bytesMigrated == 150);
  assert(a.batchesCompleted == 2);
  assert(a.startedAt && a.finishedAt);
  assert(!a.errorDetail);

  assert(!tracker.status("a", TableStatus::FAILED, "late") &&
         "terminal result is immutable");
  assert(!tracker.record("a", 1, 1) && "terminal result takes no batches");
  assert(tracker.result("a").rowsMigrated == 15);

  assert(tracker.begin("b"));
  assert(tracker.record("b", 3, 30));
  assert(tracker.status("b", TableStatus::FAILED, "boom"));
  TableResult b = tracker.result("b");
  assert(b.status == TableStatus::FAILED);
  assert(b.errorDetail && *b.errorDetail == "boom");
  assert(b.rowsMigrated == 3);

  assert(!tracker.begin("missing"));
  assert(!tracker.record("missing", 1, 1));

  MigrationReport report = tracker.snapshot();
  assert(report.overallStatus() == JobStatus::FAILED);

  std::cout << "✓ status transitions test passed\n";
}

void testSnapshotIsCopy() {
  std::cout << "Testing ProgressTracker - snapshot is a copy...\n";

  ProgressTracker tracker;
  tracker.registerTables("job", {{"a", std::nullopt}});
  tracker.begin("a");

  MigrationReport before = tracker.snapshot();
  tracker.record("a", 7, 70);
  MigrationReport after = tracker.snapshot();

  assert(before.tables[0].rowsMigrated == 0);
  assert(before.totalRows == 0);
  assert(after.tables[0].rowsMigrated == 7);
  assert(after.totalRows == 7);
  assert(after.overallStatus() == JobStatus::RUNNING);

  std::cout << "✓ snapshot copy test passed\n";
}

void testConcurrentRecordKeepsTotalsConsistent() {
  std::cout << "Testing ProgressTracker - concurrent updates...\n";

  const int tables = 8;
  const int batches = 500;

  ProgressTracker tracker;
  std::vector<TableSpec> specs;
  for (int i = 0; i < tables; ++i)
    specs.push_back({"t" + std::to_string(i), std::nullopt});
  tracker.registerTables("job", specs);

  std::vector<std::thread> writers;
  for (int i = 0; i < tables; ++i) {
    writers.emplace_back([&tracker, i] {
      std::string name = "t" + std::to_string(i);
      tracker.begin(name);
      for (int b = 0; b < batches; ++b)
        tracker.record(name, 2, 20);
      tracker.status(name, TableStatus::SUCCEEDED);
    });
  }

  bool consistent = true;
  std::thread observer([&] {
    for (int n = 0; n < 200; ++n) {
      MigrationReport snap = tracker.snapshot();
      int64_t rows = 0;
      int64_t bytes = 0;
      for (const auto &t : snap.tables) {
        rows += t.rowsMigrated;
        bytes += t.bytesMigrated;
      }
      if (rows != snap.totalRows || bytes != snap.totalBytes)
        consistent = false;
    }
  });

  for (auto &w : writers)
    w.join();
  observer.join();

  assert(consistent && "aggregate totals must equal per-table sums");

  MigrationReport report = tracker.snapshot();
  assert(report.totalRows == tables * batches * 2);
  assert(report.totalBytes == tables * batches * 20);
  assert(report.overallStatus() == JobStatus::SUCCEEDED);
  assert(tracker.peakRunning() >= 1 &&
         tracker.peakRunning() <= static_cast<size_t>(tables));

  std::cout << "✓ concurrent updates test passed\n";
}

void testCancelledReportStatus() {
  std::cout << "Testing MigrationReport - cancelled job status...\n";

  ProgressTracker tracker;
  tracker.registerTables("job", {{"a", std::nullopt},
                                 {"b", std::nullopt},
                                 {"c", std::nullopt}});
  tracker.begin("a");
  tracker.status("a", TableStatus::SUCCEEDED);
  tracker.begin("b");
  tracker.markCancelRequested();

  MigrationReport running = tracker.snapshot();
  assert(!running.isComplete());
  assert(running.overallStatus() == JobStatus::RUNNING);

  tracker.status("b", TableStatus::CANCELLED);
  MigrationReport done = tracker.snapshot();
  assert(done.isComplete());
  assert(done.overallStatus() == JobStatus::CANCELLED);
  assert(done.find("c")->status == TableStatus::PENDING);
  assert(done.find("a")->status == TableStatus::SUCCEEDED);
  assert(done.find("missing") == nullptr);

  std::cout << "✓ cancelled job status test passed\n";
}

void testStatusStrings() {
  std::cout << "Testing TableStatus string conversion...\n";

  for (auto status : {TableStatus::PENDING, TableStatus::RUNNING,
                      TableStatus::SUCCEEDED, TableStatus::FAILED,
                      TableStatus::CANCELLED}) {
    assert(tableStatusFromString(tableStatusToString(status)) == status);
  }
  assert(tableStatusFromString("FAILED") == TableStatus::FAILED);

  bool threw = false;
  try {
    tableStatusFromString("done");
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "✓ status string test passed\n";
}

int main() {
  try {
    testRegisterStartsPending();
    testTransitions();
    testSnapshotIsCopy();
    testConcurrentRecordKeepsTotalsConsistent();
    testCancelledReportStatus();
    testStatusStrings();
    std::cout << "\n✅ All ProgressTracker tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
