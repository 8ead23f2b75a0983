#include "core/errors.h"
#include "migration/migration_service.h"
#include "../support/in_memory_provider.h"
#include <cassert>
#include <iostream>
#include <thread>

namespace {

ConnectionParams endpoint(const std::string &database) {
  ConnectionParams params;
  params.database = database;
  params.user = "migrator";
  params.password = "secret";
  return params;
}

MigrationRequest request(const std::vector<std::string> &tables) {
  MigrationRequest req;
  req.source = endpoint("src");
  req.target = endpoint("dst");
  req.tables = tables;
  req.batchSize = 100;
  req.concurrency = 2;
  return req;
}

} // namespace

void testConnectionCheck() {
  std::cout << "Testing MigrationService - connection test...\n";

  InMemoryProvider provider;
  provider.addDatabase("src");
  provider.addDatabase("locked");
  provider.setFailTest("locked");
  MigrationService service(provider);

  service.testConnection(endpoint("src"));

  bool missing = false;
  try {
    service.testConnection(endpoint("nowhere"));
  } catch (const ConnectionError &e) {
    missing = true;
    std::string message = e.what();
    assert(message.find("secret") == std::string::npos &&
           "password never appears in errors");
  }
  assert(missing);

  bool locked = false;
  try {
    service.testConnection(endpoint("locked"));
  } catch (const ConnectionError &) {
    locked = true;
  }
  assert(locked);

  std::cout << "✓ connection test passed\n";
}

void testRequestValidation() {
  std::cout << "Testing MigrationService - request validation...\n";

  InMemoryProvider provider;
  provider.addDatabase("src")->seed("a", 10);
  provider.addDatabase("dst");
  MigrationService service(provider);

  auto expectInvalid = [&service](const MigrationRequest &req) {
    try {
      service.submit(req);
    } catch (const InvalidJobConfig &) {
      return true;
    }
    return false;
  };

  assert(expectInvalid(request({})));
  MigrationRequest noBatch = request({"a"});
  noBatch.batchSize = 0;
  assert(expectInvalid(noBatch));
  MigrationRequest noWorkers = request({"a"});
  noWorkers.concurrency = 0;
  assert(expectInvalid(noWorkers));
  assert(expectInvalid(request({"a", "a"})));

  assert(provider.fetchCalls("a") == 0);

  std::cout << "✓ request validation test passed\n";
}

void testUnreachableTargetIsFatal() {
  std::cout << "Testing MigrationService - unreachable target...\n";

  InMemoryProvider provider;
  provider.addDatabase("src")->seed("a", 10);
  provider.addDatabase("dst");
  provider.setUnreachable("dst");
  MigrationService service(provider);

  bool threw = false;
  try {
    service.submit(request({"a"}));
  } catch (const ConnectionError &) {
    threw = true;
  }
  assert(threw);
  assert(provider.fetchCalls("a") == 0 && "no table dispatched");

  std::cout << "✓ unreachable target test passed\n";
}

void testSubmitAndWait() {
  std::cout << "Testing MigrationService - submit and wait...\n";

  InMemoryProvider provider;
  auto src = provider.addDatabase("src");
  auto dst = provider.addDatabase("dst");
  src->seed("orders", 730);
  src->seed("customers", 40);
  MigrationService service(provider);

  auto handle = service.submit(request({"orders", "customers"}));
  assert(handle);
  assert(handle->jobId().rfind("job-", 0) == 0);

  MigrationReport report = handle->wait();
  assert(handle->isFinished());
  assert(report.jobId == handle->jobId());
  assert(report.overallStatus() == JobStatus::SUCCEEDED);
  assert(report.find("orders")->rowsMigrated == 730);
  assert(report.find("customers")->rowsMigrated == 40);
  assert(report.find("orders")->rowCountHint &&
         *report.find("orders")->rowCountHint == 730);
  assert(dst->rowCount("orders") == 730);

  // wait() can be called again and returns the same report.
  MigrationReport again = handle->wait();
  assert(again.totalRows == report.totalRows);

  auto second = service.submit(request({"customers"}));
  assert(second->jobId() != handle->jobId());
  second->wait();
  assert(dst->rowCount("customers") == 80);

  std::cout << "✓ submit and wait test passed\n";
}

void testSnapshotListsTablesRightAfterSubmit() {
  std::cout << "Testing MigrationService - snapshot right after submit...\n";

  InMemoryProvider provider;
  auto src = provider.addDatabase("src");
  provider.addDatabase("dst");
  src->seed("orders", 500);
  src->seed("customers", 500);
  provider.setDefaultDelay(std::chrono::milliseconds(20));
  MigrationService service(provider);

  for (int round = 0; round < 20; ++round) {
    auto handle = service.submit(request({"orders", "customers"}));
    MigrationReport snap = handle->snapshot();

    assert(snap.jobId == handle->jobId());
    assert(snap.tables.size() == 2);
    assert(snap.tables[0].tableName == "orders");
    assert(snap.tables[1].tableName == "customers");
    for (const auto &table : snap.tables)
      assert(table.status == TableStatus::PENDING ||
             table.status == TableStatus::RUNNING);
    assert(!snap.isComplete());
    assert(snap.overallStatus() == JobStatus::PENDING ||
           snap.overallStatus() == JobStatus::RUNNING);

    handle->cancel();
    handle->wait();
  }

  std::cout << "✓ snapshot right after submit test passed\n";
}

void testAllTablesAndHints() {
  std::cout << "Testing MigrationService - all tables...\n";

  InMemoryProvider provider;
  auto src = provider.addDatabase("src");
  provider.addDatabase("dst");
  src->seed("x", 3);
  src->seed("y", 4);
  MigrationService service(provider);

  std::vector<std::string> listed = service.listTables(endpoint("src"));
  assert(listed.size() == 2);

  MigrationRequest req = request({});
  req.allTables = true;
  req.fetchRowCountHints = false;
  MigrationReport report = service.submit(req)->wait();

  assert(report.tables.size() == 2);
  assert(report.totalRows == 7);
  for (const auto &table : report.tables)
    assert(!table.rowCountHint);

  std::cout << "✓ all tables test passed\n";
}

void testCancelThroughHandle() {
  std::cout << "Testing MigrationService - cancel through handle...\n";

  InMemoryProvider provider;
  auto src = provider.addDatabase("src");
  provider.addDatabase("dst");
  src->seed("slow", 100000);
  src->seed("queued", 10);
  provider.setDelay("slow", std::chrono::milliseconds(5));
  MigrationService service(provider);

  MigrationRequest req = request({"slow", "queued"});
  req.concurrency = 1;
  auto handle = service.submit(req);

  while (handle->snapshot().totalRows < 300)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  handle->cancel();

  MigrationReport report = handle->wait();
  assert(report.find("slow")->status == TableStatus::CANCELLED);
  assert(report.find("slow")->rowsMigrated % 100 == 0);
  assert(report.find("queued")->status == TableStatus::PENDING);
  assert(report.overallStatus() == JobStatus::CANCELLED);

  std::cout << "✓ cancel through handle test passed\n";
}

void testHandleDestructorStopsJob() {
  std::cout << "Testing MigrationHandle - destructor stops the job...\n";

  InMemoryProvider provider;
  auto src = provider.addDatabase("src");
  auto dst = provider.addDatabase("dst");
  src->seed("slow", 100000);
  provider.setDelay("slow", std::chrono::milliseconds(5));
  MigrationService service(provider);

  {
    auto handle = service.submit(request({"slow"}));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
  }
  assert(dst->rowCount("slow") < 100000);

  std::cout << "✓ destructor test passed\n";
}

int main() {
  try {
    testConnectionCheck();
    testRequestValidation();
    testUnreachableTargetIsFatal();
    testSubmitAndWait();
    testSnapshotListsTablesRightAfterSubmit();
    testAllTablesAndHints();
    testCancelThroughHandle();
    testHandleDestructorStopsJob();
    std::cout << "\n✅ All MigrationService tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
