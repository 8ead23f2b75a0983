#include "core/migration_settings.h"

std::atomic<size_t> MigrationSettings::BATCH_SIZE =
    MigrationSettings::DEFAULT_BATCH_SIZE;
std::atomic<size_t> MigrationSettings::MAX_WORKERS =
    MigrationSettings::DEFAULT_MAX_WORKERS;
std::atomic<size_t> MigrationSettings::PROGRESS_INTERVAL_MS =
    MigrationSettings::DEFAULT_PROGRESS_INTERVAL_MS;
