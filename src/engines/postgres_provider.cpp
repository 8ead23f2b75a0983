#include "engines/postgres_provider.h"
#include "core/errors.h"
#include "core/logger.h"
#include <cctype>

PostgreSQLSession::PostgreSQLSession(ConnectionParams params,
                                     size_t maxConnections,
                                     std::chrono::seconds acquireTimeout)
    : params_(std::move(params)),
      connectionString_(params_.toConnectionString()),
      maxConnections_(maxConnections == 0 ? 1 : maxConnections),
      acquireTimeout_(acquireTimeout) {}

PostgreSQLSession::~PostgreSQLSession() {
  std::lock_guard<std::mutex> lock(poolMutex_);
  closed_ = true;
  idle_.clear();
}

bool PostgreSQLSession::isOpen() const {
  std::lock_guard<std::mutex> lock(poolMutex_);
  return !closed_;
}

size_t PostgreSQLSession::openConnections() const {
  std::lock_guard<std::mutex> lock(poolMutex_);
  return idle_.size() + leased_;
}

// Hands out an idle connection, opens a new one while under the pool limit,
// or waits up to acquireTimeout_ for another worker to give one back.
PostgreSQLSession::Lease PostgreSQLSession::acquire() {
  std::unique_lock<std::mutex> lock(poolMutex_);

  if (!poolCondition_.wait_for(lock, acquireTimeout_, [this] {
        return closed_ || !idle_.empty() ||
               idle_.size() + leased_ < maxConnections_;
      })) {
    throw std::runtime_error("timeout waiting for a connection to " +
                             endpoint());
  }
  if (closed_) {
    throw std::runtime_error("session to " + endpoint() + " is closed");
  }

  if (!idle_.empty()) {
    std::unique_ptr<pqxx::connection> conn = std::move(idle_.back());
    idle_.pop_back();
    leased_++;
    return Lease(*this, std::move(conn));
  }

  leased_++;
  lock.unlock();
  try {
    auto conn = std::make_unique<pqxx::connection>(connectionString_);
    Logger::debug(LogCategory::DATABASE, "PostgreSQLSession",
                  "Opened connection to " + endpoint());
    return Lease(*this, std::move(conn));
  } catch (...) {
    lock.lock();
    leased_--;
    poolCondition_.notify_one();
    throw;
  }
}

void PostgreSQLSession::release(std::unique_ptr<pqxx::connection> conn) {
  std::lock_guard<std::mutex> lock(poolMutex_);
  leased_--;
  if (conn && conn->is_open() && !closed_) {
    idle_.push_back(std::move(conn));
  }
  poolCondition_.notify_one();
}

PostgreSQLConnectionProvider::PostgreSQLConnectionProvider(
    size_t maxConnectionsPerSession, std::chrono::seconds acquireTimeout)
    : maxConnectionsPerSession_(maxConnectionsPerSession),
      acquireTimeout_(acquireTimeout) {}

PostgreSQLSession &PostgreSQLConnectionProvider::asPostgres(ISession &session) {
  auto *pg = dynamic_cast<PostgreSQLSession *>(&session);
  if (!pg) {
    throw std::invalid_argument("session " + session.endpoint() +
                                " was not opened by the PostgreSQL provider");
  }
  return *pg;
}

std::shared_ptr<ISession>
PostgreSQLConnectionProvider::connect(const ConnectionParams &params) {
  if (params.database.empty()) {
    throw ConnectionError(params.toLogString(), "database name is empty");
  }

  auto session = std::make_shared<PostgreSQLSession>(
      params, maxConnectionsPerSession_, acquireTimeout_);
  testConnection(*session);
  Logger::info(LogCategory::DATABASE, "PostgreSQLConnectionProvider",
               "Connected to " + session->endpoint());
  return session;
}

void PostgreSQLConnectionProvider::testConnection(ISession &session) {
  try {
    PostgreSQLSession &pg = asPostgres(session);
    auto conn = pg.acquire();
    try {
      pqxx::work testTxn(*conn);
      testTxn.exec("SELECT 1");
      testTxn.commit();
    } catch (const pqxx::broken_connection &) {
      conn.discard();
      throw;
    }
  } catch (const std::exception &e) {
    throw ConnectionError(session.endpoint(), e.what());
  }
}

std::string
PostgreSQLConnectionProvider::qualifiedName(pqxx::transaction_base &txn,
                                            const std::string &defaultSchema,
                                            const std::string &tableName) {
  auto dot = tableName.find('.');
  if (dot == std::string::npos) {
    return txn.quote_name(defaultSchema) + "." + txn.quote_name(tableName);
  }
  return txn.quote_name(tableName.substr(0, dot)) + "." +
         txn.quote_name(tableName.substr(dot + 1));
}

size_t PostgreSQLConnectionProvider::parseOffset(const std::string &tableName,
                                                 const CursorToken &cursor) {
  if (cursor.empty())
    return 0;
  for (char c : cursor) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      throw ReadError(tableName, "malformed cursor token '" + cursor + "'");
  }
  try {
    return static_cast<size_t>(std::stoull(cursor));
  } catch (const std::exception &) {
    throw ReadError(tableName, "malformed cursor token '" + cursor + "'");
  }
}

// Pages with LIMIT/OFFSET ordered by ctid, which is stable as long as nothing
// else writes to the source table during the migration. The continuation
// token is the next offset in decimal.
FetchResult PostgreSQLConnectionProvider::fetchBatch(
    ISession &session, const std::string &tableName, const CursorToken &cursor,
    size_t size) {
  size_t offset = parseOffset(tableName, cursor);

  try {
    PostgreSQLSession &pg = asPostgres(session);
    auto conn = pg.acquire();

    FetchResult fetched;
    try {
      pqxx::work txn(*conn);
      std::string query = "SELECT * FROM " +
                          qualifiedName(txn, pg.schema(), tableName) +
                          " ORDER BY ctid LIMIT " + std::to_string(size) +
                          " OFFSET " + std::to_string(offset);
      pqxx::result results = txn.exec(query);
      txn.commit();

      for (pqxx::row::size_type col = 0; col < results.columns(); ++col) {
        fetched.batch.columns.emplace_back(results.column_name(col));
      }

      fetched.batch.rows.reserve(results.size());
      for (const auto &row : results) {
        Row values;
        values.reserve(row.size());
        for (const auto &field : row) {
          if (field.is_null())
            values.emplace_back(std::nullopt);
          else
            values.emplace_back(std::string(field.c_str(), field.size()));
        }
        fetched.batch.rows.push_back(std::move(values));
      }
    } catch (const pqxx::broken_connection &) {
      conn.discard();
      throw;
    }

    fetched.next = std::to_string(offset + fetched.batch.size());
    fetched.exhausted = fetched.batch.size() < size;
    return fetched;
  } catch (const ReadError &) {
    throw;
  } catch (const std::exception &e) {
    throw ReadError(tableName, e.what());
  }
}

// One multi-row INSERT inside one transaction: the batch lands completely or
// not at all. Values are sent as quoted text literals and cast by the server
// to the target column types.
void PostgreSQLConnectionProvider::insertBatch(ISession &session,
                                               const std::string &tableName,
                                               const RowBatch &batch) {
  if (batch.empty())
    return;

  try {
    PostgreSQLSession &pg = asPostgres(session);
    auto conn = pg.acquire();

    try {
      pqxx::work txn(*conn);
      std::string query =
          "INSERT INTO " + qualifiedName(txn, pg.schema(), tableName);

      if (!batch.columns.empty()) {
        query += " (";
        for (size_t i = 0; i < batch.columns.size(); ++i) {
          if (i > 0)
            query += ", ";
          query += txn.quote_name(batch.columns[i]);
        }
        query += ")";
      }

      query += " VALUES ";
      for (size_t r = 0; r < batch.rows.size(); ++r) {
        const Row &row = batch.rows[r];
        if (!batch.columns.empty() && row.size() != batch.columns.size()) {
          throw WriteError(tableName,
                           "row " + std::to_string(r) + " has " +
                               std::to_string(row.size()) + " values for " +
                               std::to_string(batch.columns.size()) +
                               " columns");
        }
        if (r > 0)
          query += ", ";
        query += "(";
        for (size_t c = 0; c < row.size(); ++c) {
          if (c > 0)
            query += ", ";
          query += row[c] ? txn.quote(*row[c]) : std::string("NULL");
        }
        query += ")";
      }

      txn.exec(query);
      txn.commit();
    } catch (const pqxx::broken_connection &) {
      conn.discard();
      throw;
    }
  } catch (const WriteError &) {
    throw;
  } catch (const std::exception &e) {
    throw WriteError(tableName, e.what());
  }
}

std::vector<std::string>
PostgreSQLConnectionProvider::listTables(ISession &session) {
  std::vector<std::string> tables;
  try {
    PostgreSQLSession &pg = asPostgres(session);
    auto conn = pg.acquire();
    pqxx::work txn(*conn);
    auto results = txn.exec_params("SELECT table_name "
                                   "FROM information_schema.tables "
                                   "WHERE table_schema = $1 "
                                   "AND table_type = 'BASE TABLE' "
                                   "ORDER BY table_name",
                                   pg.schema());
    txn.commit();

    for (const auto &row : results) {
      if (!row[0].is_null())
        tables.push_back(row[0].as<std::string>());
    }
  } catch (const std::exception &e) {
    throw ReadError(session.endpoint(),
                    "listing tables: " + std::string(e.what()));
  }
  return tables;
}

std::optional<int64_t>
PostgreSQLConnectionProvider::countRows(ISession &session,
                                        const std::string &tableName) {
  try {
    PostgreSQLSession &pg = asPostgres(session);
    auto conn = pg.acquire();
    pqxx::work txn(*conn);
    auto results = txn.exec("SELECT COUNT(*) FROM " +
                            qualifiedName(txn, pg.schema(), tableName));
    txn.commit();

    if (!results.empty() && !results[0][0].is_null())
      return results[0][0].as<int64_t>();
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::DATABASE, "PostgreSQLConnectionProvider",
                    "Could not count rows of " + tableName + ": " +
                        std::string(e.what()));
  }
  return std::nullopt;
}
