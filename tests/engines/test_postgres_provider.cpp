#include "core/errors.h"
#include "engines/postgres_provider.h"
#include "../support/in_memory_provider.h"
#include <cassert>
#include <iostream>

void testParseOffset() {
  std::cout << "Testing PostgreSQLConnectionProvider - cursor tokens...\n";

  assert(PostgreSQLConnectionProvider::parseOffset("t", "") == 0);
  assert(PostgreSQLConnectionProvider::parseOffset("t", "2000") == 2000);

  for (const char *bad : {"-1", "12a", "1 0", "99999999999999999999999"}) {
    bool threw = false;
    try {
      PostgreSQLConnectionProvider::parseOffset("orders", bad);
    } catch (const ReadError &e) {
      threw = true;
      assert(e.table() == "orders");
    }
    assert(threw);
  }

  std::cout << "✓ cursor token test passed\n";
}

void testConnectFailures() {
  std::cout << "Testing PostgreSQLConnectionProvider - connect failures...\n";

  PostgreSQLConnectionProvider provider(2, std::chrono::seconds(2));

  ConnectionParams noDatabase;
  bool threw = false;
  try {
    provider.connect(noDatabase);
  } catch (const ConnectionError &) {
    threw = true;
  }
  assert(threw);

  // Nothing listens on port 1.
  ConnectionParams closedPort;
  closedPort.host = "127.0.0.1";
  closedPort.port = "1";
  closedPort.database = "postgres";
  closedPort.user = "nobody";
  closedPort.password = "hidden-pw";
  closedPort.connectTimeoutSeconds = 1;

  threw = false;
  try {
    provider.connect(closedPort);
  } catch (const ConnectionError &e) {
    threw = true;
    assert(e.endpoint() == closedPort.toLogString());
    assert(std::string(e.what()).find("hidden-pw") == std::string::npos);
  }
  assert(threw);

  std::cout << "✓ connect failures test passed\n";
}

void testForeignSessionRejected() {
  std::cout << "Testing PostgreSQLConnectionProvider - foreign session...\n";

  InMemoryProvider memory;
  memory.addDatabase("src");
  auto session = memory.open("src");

  PostgreSQLConnectionProvider provider;

  bool readFailed = false;
  try {
    provider.fetchBatch(*session, "orders", "", 10);
  } catch (const ReadError &) {
    readFailed = true;
  }
  assert(readFailed);

  bool writeFailed = false;
  RowBatch batch;
  batch.columns = {"id"};
  batch.rows.push_back({std::string("1")});
  try {
    provider.insertBatch(*session, "orders", batch);
  } catch (const WriteError &) {
    writeFailed = true;
  }
  assert(writeFailed);

  assert(!provider.countRows(*session, "orders"));

  std::cout << "✓ foreign session test passed\n";
}

void testSessionPoolLimit() {
  std::cout << "Testing PostgreSQLSession - pool bookkeeping...\n";

  ConnectionParams params;
  params.database = "postgres";
  PostgreSQLSession session(params, 0, std::chrono::seconds(1));
  assert(session.isOpen());
  assert(session.openConnections() == 0);
  assert(session.endpoint() == params.toLogString());

  std::cout << "✓ pool bookkeeping test passed\n";
}

int main() {
  try {
    testParseOffset();
    testConnectFailures();
    testForeignSessionRejected();
    testSessionPoolLimit();
    std::cout << "\n✅ All PostgreSQL provider tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
