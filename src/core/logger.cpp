#include "core/logger.h"
#include "core/file_log_writer.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  struct tm tm_buf;
  localtime_r(&seconds, &tm_buf);

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}
} // namespace

// Writers receive every formatted line that passes the level filter. With no
// writer registered (Logger::initialize not called, as in unit tests) log
// calls are dropped.
std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},
    {"DATABASE", LogCategory::DATABASE},
    {"TRANSFER", LogCategory::TRANSFER},
    {"CONFIG", LogCategory::CONFIG},
    {"PROGRESS", LogCategory::PROGRESS}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCategoryString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::PROGRESS:
    return "PROGRESS";
  default:
    return "UNKNOWN";
  }
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(categoryStr);
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  auto it = levelMap.find(upper);
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
  }

  if (level < minLevel) {
    return;
  }

  std::ostringstream line;
  line << "[" << currentTimestamp() << "] [" << getLevelString(level) << "] ["
       << getCategoryString(category) << "]";
  if (!function.empty())
    line << " [" << function << "]";
  line << " " << message;

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer && writer->isOpen()) {
      writer->write(line.str());
    }
  }
}

// Installs the console and file writers described by settings. The
// DATAMIGRATE_LOG_LEVEL environment variable overrides the configured level.
// A log file that cannot be opened is reported on stderr and skipped; the
// console writer keeps working.
void Logger::initialize(const LoggingSettings &settings) {
  setLogLevel(settings.level);
  if (const char *envLevel = std::getenv("DATAMIGRATE_LOG_LEVEL")) {
    setLogLevel(std::string(envLevel));
  }

  std::lock_guard<std::mutex> lock(logMutex);
  writers_.clear();

  if (settings.console) {
    writers_.push_back(std::make_unique<ConsoleLogWriter>());
  }

  if (!settings.file.empty()) {
    try {
      auto fileWriter = std::make_unique<FileLogWriter>(
          settings.file, settings.maxFileSize, settings.maxBackupFiles);
      if (fileWriter->isOpen()) {
        writers_.push_back(std::move(fileWriter));
      } else {
        std::cerr << "Warning: could not open log file '" << settings.file
                  << "', file logging disabled" << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "Error initializing file log writer: " << e.what()
                << std::endl;
    }
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer) {
      writer->close();
    }
  }
  writers_.clear();
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  if (!writer)
    return;
  std::lock_guard<std::mutex> lock(logMutex);
  writers_.push_back(std::move(writer));
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Unknown or empty strings leave the level unchanged.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
