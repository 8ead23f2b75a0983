#ifndef POSTGRES_PROVIDER_H
#define POSTGRES_PROVIDER_H

#include "engines/connection_provider.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

// One PostgreSQL endpoint shared by all table workers of a job. pqxx
// connections are not thread-safe, so the session keeps a small pool and
// lends one connection to each call.
class PostgreSQLSession : public ISession {
public:
  class Lease {
  public:
    Lease(PostgreSQLSession &session, std::unique_ptr<pqxx::connection> conn)
        : session_(&session), conn_(std::move(conn)) {}
    ~Lease() {
      if (session_)
        session_->release(std::move(conn_));
    }

    Lease(Lease &&other) noexcept
        : session_(other.session_), conn_(std::move(other.conn_)) {
      other.session_ = nullptr;
    }
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    Lease &operator=(Lease &&) = delete;

    pqxx::connection &operator*() const { return *conn_; }
    pqxx::connection *operator->() const { return conn_.get(); }

    // Drops a connection that failed mid-call instead of returning it to the
    // idle list; its pool slot is still freed.
    void discard() { conn_.reset(); }

  private:
    PostgreSQLSession *session_;
    std::unique_ptr<pqxx::connection> conn_;
  };

  PostgreSQLSession(ConnectionParams params, size_t maxConnections,
                    std::chrono::seconds acquireTimeout);
  ~PostgreSQLSession() override;

  PostgreSQLSession(const PostgreSQLSession &) = delete;
  PostgreSQLSession &operator=(const PostgreSQLSession &) = delete;

  std::string endpoint() const override { return params_.toLogString(); }
  bool isOpen() const override;

  const std::string &schema() const { return params_.schema; }

  // Throws pqxx::broken_connection or std::runtime_error on timeout.
  Lease acquire();
  size_t openConnections() const;

private:
  void release(std::unique_ptr<pqxx::connection> conn);

  ConnectionParams params_;
  std::string connectionString_;
  size_t maxConnections_;
  std::chrono::seconds acquireTimeout_;

  mutable std::mutex poolMutex_;
  std::condition_variable poolCondition_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  size_t leased_ = 0;
  bool closed_ = false;
};

class PostgreSQLConnectionProvider : public IConnectionProvider {
private:
  size_t maxConnectionsPerSession_;
  std::chrono::seconds acquireTimeout_;

  static PostgreSQLSession &asPostgres(ISession &session);

public:
  explicit PostgreSQLConnectionProvider(
      size_t maxConnectionsPerSession = 4,
      std::chrono::seconds acquireTimeout = std::chrono::seconds(30));

  std::shared_ptr<ISession> connect(const ConnectionParams &params) override;
  void testConnection(ISession &session) override;

  FetchResult fetchBatch(ISession &session, const std::string &tableName,
                         const CursorToken &cursor, size_t size) override;
  void insertBatch(ISession &session, const std::string &tableName,
                   const RowBatch &batch) override;

  std::vector<std::string> listTables(ISession &session) override;
  std::optional<int64_t> countRows(ISession &session,
                                   const std::string &tableName) override;

  // "schema.table" is taken as given; a bare name uses the session schema.
  static std::string qualifiedName(pqxx::transaction_base &txn,
                                   const std::string &defaultSchema,
                                   const std::string &tableName);
  static size_t parseOffset(const std::string &tableName,
                            const CursorToken &cursor);
};

#endif
