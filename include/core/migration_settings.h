#ifndef MIGRATION_SETTINGS_H
#define MIGRATION_SETTINGS_H

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>

// Process-wide tuning knobs used when a job does not name its own values.
struct MigrationSettings {
  static std::atomic<size_t> BATCH_SIZE;
  static std::atomic<size_t> MAX_WORKERS;
  static std::atomic<size_t> PROGRESS_INTERVAL_MS;

  static constexpr size_t DEFAULT_BATCH_SIZE = 2000;
  static constexpr size_t DEFAULT_MAX_WORKERS = 4;
  static constexpr size_t DEFAULT_PROGRESS_INTERVAL_MS = 500;

  static constexpr size_t MIN_BATCH_SIZE = 1;
  static constexpr size_t MAX_BATCH_SIZE = 100000;
  static constexpr size_t MIN_MAX_WORKERS = 1;
  static constexpr size_t MAX_MAX_WORKERS = 32;
  static constexpr size_t MIN_PROGRESS_INTERVAL_MS = 50;
  static constexpr size_t MAX_PROGRESS_INTERVAL_MS = 60000;

  static void setBatchSize(size_t newSize) {
    if (newSize < MIN_BATCH_SIZE || newSize > MAX_BATCH_SIZE) {
      throw std::invalid_argument("BATCH_SIZE must be between " +
                                  std::to_string(MIN_BATCH_SIZE) + " and " +
                                  std::to_string(MAX_BATCH_SIZE));
    }
    BATCH_SIZE = newSize;
  }

  static size_t getBatchSize() { return BATCH_SIZE; }

  static void setMaxWorkers(size_t v) {
    if (v < MIN_MAX_WORKERS || v > MAX_MAX_WORKERS) {
      throw std::invalid_argument("MAX_WORKERS must be between " +
                                  std::to_string(MIN_MAX_WORKERS) + " and " +
                                  std::to_string(MAX_MAX_WORKERS));
    }
    MAX_WORKERS = v;
  }

  static size_t getMaxWorkers() { return MAX_WORKERS; }

  static void setProgressInterval(size_t ms) {
    if (ms < MIN_PROGRESS_INTERVAL_MS || ms > MAX_PROGRESS_INTERVAL_MS) {
      throw std::invalid_argument("PROGRESS_INTERVAL_MS must be between " +
                                  std::to_string(MIN_PROGRESS_INTERVAL_MS) +
                                  " and " +
                                  std::to_string(MAX_PROGRESS_INTERVAL_MS));
    }
    PROGRESS_INTERVAL_MS = ms;
  }

  static size_t getProgressInterval() { return PROGRESS_INTERVAL_MS; }

  static void resetDefaults() {
    BATCH_SIZE = DEFAULT_BATCH_SIZE;
    MAX_WORKERS = DEFAULT_MAX_WORKERS;
    PROGRESS_INTERVAL_MS = DEFAULT_PROGRESS_INTERVAL_MS;
  }
};

#endif
