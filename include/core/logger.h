#ifndef LOGGER_H
#define LOGGER_H

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  TRANSFER = 2,
  CONFIG = 3,
  PROGRESS = 4,
  UNKNOWN = 99
};

// Destination for formatted log lines. Writers are owned by the Logger and
// called with the Logger's lock held, one line at a time.
class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &line) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

// The "logging" section of config.json.
struct LoggingSettings {
  std::string level = "INFO";
  bool console = true;
  std::string file;
  size_t maxFileSize = 10 * 1024 * 1024;
  int maxBackupFiles = 5;
};

// Process-wide logger. Lines look like
//   [2024-05-01 10:00:00.123] [INFO] [TRANSFER] [TableMigrator] message
// and go to every registered writer. Until initialize() or addWriter() is
// called nothing is written.
class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

public:
  static void initialize(const LoggingSettings &settings = LoggingSettings());
  static void shutdown();
  static void addWriter(std::unique_ptr<ILogWriter> writer);

  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();

  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static LogCategory stringToCategory(const std::string &categoryStr);
  static LogLevel stringToLogLevel(const std::string &levelStr);

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }
  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }
  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }
  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }
  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  // Without a function tag.
  static void debug(LogCategory category, const std::string &message) {
    writeLog(LogLevel::DEBUG, category, "", message);
  }
  static void info(LogCategory category, const std::string &message) {
    writeLog(LogLevel::INFO, category, "", message);
  }
  static void warning(LogCategory category, const std::string &message) {
    writeLog(LogLevel::WARNING, category, "", message);
  }
  static void error(LogCategory category, const std::string &message) {
    writeLog(LogLevel::ERROR, category, "", message);
  }
  static void critical(LogCategory category, const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, "", message);
  }
};

#endif
