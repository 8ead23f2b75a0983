#include "core/file_log_writer.h"
#include "core/logger.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <vector>

namespace {

struct CapturedLines {
  std::mutex mutex;
  std::vector<std::string> lines;
};

class CapturingWriter : public ILogWriter {
public:
  explicit CapturingWriter(std::shared_ptr<CapturedLines> sink)
      : sink_(std::move(sink)) {}

  bool write(const std::string &formattedMessage) override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->lines.push_back(formattedMessage);
    return true;
  }
  void flush() override {}
  void close() override { open_ = false; }
  bool isOpen() const override { return open_; }

private:
  std::shared_ptr<CapturedLines> sink_;
  bool open_ = true;
};

std::shared_ptr<CapturedLines> installCapture() {
  Logger::shutdown();
  auto sink = std::make_shared<CapturedLines>();
  Logger::addWriter(std::make_unique<CapturingWriter>(sink));
  return sink;
}

// Reads the N out of the first "line N ..." entry of a log file.
int firstLineNumber(const std::string &path) {
  std::ifstream in(path);
  std::string word;
  int number = -1;
  in >> word >> number;
  return number;
}

} // namespace

void testLineFormat() {
  std::cout << "Testing Logger - line format...\n";

  auto sink = installCapture();
  Logger::setLogLevel(LogLevel::DEBUG);

  Logger::info(LogCategory::TRANSFER, "TableMigrator", "Starting orders");
  Logger::warning(LogCategory::SYSTEM, "plain message");

  assert(sink->lines.size() == 2);
  const std::string &first = sink->lines[0];
  assert(first.front() == '[');
  assert(first.find("] [INFO] [TRANSFER] [TableMigrator] Starting orders") !=
         std::string::npos);
  assert(sink->lines[1].find("[WARNING] [SYSTEM] plain message") !=
         std::string::npos);

  Logger::shutdown();
  std::cout << "✓ line format test passed\n";
}

void testLevelFilter() {
  std::cout << "Testing Logger - level filter...\n";

  auto sink = installCapture();
  Logger::setLogLevel("warn");
  assert(Logger::getCurrentLogLevel() == LogLevel::WARNING);

  Logger::debug(LogCategory::DATABASE, "dropped");
  Logger::info(LogCategory::DATABASE, "dropped");
  Logger::error(LogCategory::DATABASE, "kept");
  Logger::critical(LogCategory::DATABASE, "kept");
  assert(sink->lines.size() == 2);

  Logger::setLogLevel("nonsense");
  assert(Logger::getCurrentLogLevel() == LogLevel::WARNING &&
         "unknown level leaves the level unchanged");
  Logger::setLogLevel("");
  assert(Logger::getCurrentLogLevel() == LogLevel::WARNING);

  Logger::setLogLevel(LogLevel::INFO);
  Logger::shutdown();
  std::cout << "✓ level filter test passed\n";
}

void testStringConversions() {
  std::cout << "Testing Logger - string conversions...\n";

  assert(Logger::stringToLogLevel("fatal") == LogLevel::CRITICAL);
  assert(Logger::stringToLogLevel("Error") == LogLevel::ERROR);
  assert(Logger::stringToLogLevel("bogus") == LogLevel::INFO);
  assert(Logger::getLevelString(LogLevel::WARNING) == "WARNING");
  assert(Logger::stringToCategory("PROGRESS") == LogCategory::PROGRESS);
  assert(Logger::stringToCategory("nothing") == LogCategory::UNKNOWN);
  assert(Logger::getCategoryString(LogCategory::CONFIG) == "CONFIG");

  std::cout << "✓ string conversions test passed\n";
}

void testFileWriterRotation() {
  std::cout << "Testing FileLogWriter - rotation...\n";

  std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "datamigrate_logger_test";
  std::filesystem::remove_all(dir);
  std::string fileName = (dir / "nested" / "migrate.log").string();

  {
    FileLogWriter writer(fileName, 200, 3);
    assert(writer.isOpen() && "parent directories are created");
    for (int i = 0; i < 40; ++i) {
      bool written = writer.write("line " + std::to_string(i) +
                                  " with some padding to fill the file");
      assert(written);
    }
    writer.flush();
  }

  assert(std::filesystem::exists(fileName));
  assert(std::filesystem::exists(fileName + ".1"));
  assert(std::filesystem::exists(fileName + ".2"));
  assert(std::filesystem::exists(fileName + ".3") &&
         "all three backups are kept");
  assert(!std::filesystem::exists(fileName + ".4") &&
         "backups beyond the limit are dropped");
  assert(firstLineNumber(fileName + ".1") > firstLineNumber(fileName + ".2"));
  assert(firstLineNumber(fileName + ".2") > firstLineNumber(fileName + ".3"));
  assert(std::filesystem::file_size(fileName) < 400);

  FileLogWriter reopened(fileName, 1024 * 1024, 3);
  reopened.close();
  assert(!reopened.isOpen());
  assert(!reopened.write("after close"));

  std::filesystem::remove_all(dir);
  std::cout << "✓ rotation test passed\n";
}

void testInitializeFromSettings() {
  std::cout << "Testing Logger - initialize from settings...\n";

  std::filesystem::path file =
      std::filesystem::temp_directory_path() / "datamigrate_init_test.log";
  std::filesystem::remove(file);

  LoggingSettings settings;
  settings.level = "ERROR";
  settings.console = false;
  settings.file = file.string();
  Logger::initialize(settings);
  if (std::getenv("DATAMIGRATE_LOG_LEVEL") == nullptr)
    assert(Logger::getCurrentLogLevel() == LogLevel::ERROR);

  Logger::error(LogCategory::CONFIG, "MigrationConfig", "bad port");
  Logger::shutdown();

  std::ifstream in(file);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  assert(content.find("[ERROR] [CONFIG] [MigrationConfig] bad port") !=
         std::string::npos);
  std::filesystem::remove(file);

  Logger::setLogLevel(LogLevel::INFO);
  std::cout << "✓ initialize test passed\n";
}

int main() {
  try {
    testLineFormat();
    testLevelFilter();
    testStringConversions();
    testFileWriterRotation();
    testInitializeFromSettings();
    std::cout << "\n✅ All Logger tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
