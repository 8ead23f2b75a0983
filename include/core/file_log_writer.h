#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/logger.h"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  mutable std::mutex mutex_;

public:
  FileLogWriter(const std::string &fileName,
                size_t maxFileSize = 10 * 1024 * 1024, int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  void rotate();

private:
  void checkAndRotate();
  void rotateUnlocked();
};

// Writes to stderr so progress lines on stdout stay readable.
class ConsoleLogWriter : public ILogWriter {
private:
  std::mutex mutex_;
  bool open_ = true;

public:
  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override { return open_; }
};

#endif
