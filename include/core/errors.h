#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Base for every error the migration engine raises itself. Errors from the
// database client are translated into one of the subclasses at the
// connection provider boundary.
class MigrationError : public std::runtime_error {
public:
  explicit MigrationError(const std::string &message)
      : std::runtime_error(message) {}
};

// Bad batch size, concurrency or table list. Raised before any work starts.
class InvalidJobConfig : public MigrationError {
public:
  explicit InvalidJobConfig(const std::string &message)
      : MigrationError("Invalid job configuration: " + message) {}
};

// Session establishment or connectivity test failure. Fatal to the job.
class ConnectionError : public MigrationError {
public:
  ConnectionError(const std::string &endpoint, const std::string &message)
      : MigrationError("Connection to " + endpoint + " failed: " + message),
        endpoint_(endpoint) {}

  const std::string &endpoint() const { return endpoint_; }

private:
  std::string endpoint_;
};

class ReadError : public MigrationError {
public:
  ReadError(const std::string &table, const std::string &message)
      : MigrationError("Read from " + table + " failed: " + message),
        table_(table) {}

  const std::string &table() const { return table_; }

private:
  std::string table_;
};

class WriteError : public MigrationError {
public:
  WriteError(const std::string &table, const std::string &message)
      : MigrationError("Write to " + table + " failed: " + message),
        table_(table) {}

  const std::string &table() const { return table_; }

private:
  std::string table_;
};

#endif
