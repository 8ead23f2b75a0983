#include "core/file_log_writer.h"
#include <iostream>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  std::filesystem::path filePath(fileName_);
  if (filePath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(filePath.parent_path(), ec);
  }
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  checkAndRotate();

  file_ << formattedMessage << '\n';
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotate() {
  std::lock_guard<std::mutex> lock(mutex_);
  rotateUnlocked();
}

void FileLogWriter::checkAndRotate() {
  if (!file_.is_open())
    return;

  file_.flush();
  std::error_code ec;
  auto fileSize = std::filesystem::file_size(fileName_, ec);
  if (!ec && fileSize >= maxFileSize_) {
    rotateUnlocked();
  }
}

// Shifts name.1 .. name.(N-1) up by one, drops the oldest backup and reopens
// a fresh file under the original name.
void FileLogWriter::rotateUnlocked() {
  if (file_.is_open()) {
    file_.close();
  }

  std::error_code ec;
  if (maxBackupFiles_ <= 0) {
    std::filesystem::remove(fileName_, ec);
    file_.open(fileName_, std::ios::trunc);
    return;
  }

  // Keeps name.1 (newest) through name.N (oldest).
  std::filesystem::remove(fileName_ + "." + std::to_string(maxBackupFiles_),
                          ec);
  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string oldFile = fileName_ + "." + std::to_string(i);
    std::string newFile = fileName_ + "." + std::to_string(i + 1);
    if (std::filesystem::exists(oldFile, ec)) {
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (std::filesystem::exists(fileName_, ec)) {
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  }

  file_.open(fileName_, std::ios::app);
}

bool ConsoleLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_)
    return false;
  std::cerr << formattedMessage << '\n';
  return std::cerr.good();
}

void ConsoleLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

void ConsoleLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
  open_ = false;
}
