#ifndef CONNECTION_PROVIDER_H
#define CONNECTION_PROVIDER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// std::nullopt is SQL NULL. Values are carried as the text the client library
// returned and written back unchanged.
using FieldValue = std::optional<std::string>;
using Row = std::vector<FieldValue>;

struct RowBatch {
  std::vector<std::string> columns;
  std::vector<Row> rows;

  size_t size() const { return rows.size(); }
  bool empty() const { return rows.empty(); }

  size_t byteSize() const {
    size_t total = 0;
    for (const auto &row : rows) {
      for (const auto &field : row) {
        if (field)
          total += field->size();
      }
    }
    return total;
  }
};

// Position in a table's row stream. The engine never interprets it; an empty
// token means "start of table".
using CursorToken = std::string;

struct FetchResult {
  RowBatch batch;
  CursorToken next;
  bool exhausted = false;
};

struct ConnectionParams {
  std::string host = "localhost";
  std::string port = "5432";
  std::string database;
  std::string user;
  std::string password;
  std::string schema = "public";
  int connectTimeoutSeconds = 10;

  std::string toConnectionString() const;
  std::string toLogString() const;
};

class ISession {
public:
  virtual ~ISession() = default;

  virtual std::string endpoint() const = 0;
  virtual bool isOpen() const = 0;
};

// Database-specific client primitives consumed by the migration engine.
// Implementations must tolerate concurrent calls on one session from several
// table workers, one call in flight per worker.
class IConnectionProvider {
public:
  virtual ~IConnectionProvider() = default;

  // Throws ConnectionError.
  virtual std::shared_ptr<ISession> connect(const ConnectionParams &params) = 0;
  // Throws ConnectionError.
  virtual void testConnection(ISession &session) = 0;

  // Throws ReadError.
  virtual FetchResult fetchBatch(ISession &session,
                                 const std::string &tableName,
                                 const CursorToken &cursor, size_t size) = 0;
  // All rows or none become visible. Throws WriteError.
  virtual void insertBatch(ISession &session, const std::string &tableName,
                           const RowBatch &batch) = 0;

  // Throws ReadError.
  virtual std::vector<std::string> listTables(ISession &session) = 0;
  // Returns std::nullopt when the count is unavailable.
  virtual std::optional<int64_t> countRows(ISession &session,
                                           const std::string &tableName) = 0;
};

#endif
