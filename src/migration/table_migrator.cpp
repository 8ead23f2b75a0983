#include "migration/table_migrator.h"
#include "core/errors.h"
#include "core/logger.h"
#include "migration/batch_cursor.h"

TableMigrator::TableMigrator(IConnectionProvider &provider,
                             ProgressTracker &tracker,
                             const CancellationToken &cancelToken)
    : provider_(provider), tracker_(tracker), cancelToken_(cancelToken) {}

TableResult TableMigrator::migrate(const TableSpec &table, ISession &source,
                                   ISession &target, size_t batchSize) {
  if (!tracker_.begin(table.name)) {
    return tracker_.result(table.name);
  }

  Logger::info(LogCategory::TRANSFER, "TableMigrator",
               "Starting " + table.name + " (batch size " +
                   std::to_string(batchSize) + ")");

  BatchCursor cursor(provider_, table.name);
  int64_t rowsMigrated = 0;

  try {
    while (true) {
      if (cursor.exhausted()) {
        tracker_.status(table.name, TableStatus::SUCCEEDED);
        break;
      }

      if (cancelToken_.isCancelled()) {
        Logger::warning(LogCategory::TRANSFER, "TableMigrator",
                        "Cancelled " + table.name + " after " +
                            std::to_string(rowsMigrated) + " rows");
        tracker_.status(table.name, TableStatus::CANCELLED);
        break;
      }

      FetchResult fetched = cursor.next(source, batchSize);
      if (fetched.batch.empty()) {
        tracker_.status(table.name, TableStatus::SUCCEEDED);
        break;
      }

      provider_.insertBatch(target, table.name, fetched.batch);

      cursor.advance(fetched);
      int64_t rows = static_cast<int64_t>(fetched.batch.size());
      rowsMigrated += rows;
      tracker_.record(table.name, rows,
                      static_cast<int64_t>(fetched.batch.byteSize()));

      Logger::debug(LogCategory::TRANSFER, "TableMigrator",
                    table.name + ": batch " +
                        std::to_string(cursor.batchesRead()) + " wrote " +
                        std::to_string(rows) + " rows (total " +
                        std::to_string(rowsMigrated) + ")");
    }
  } catch (const ReadError &e) {
    Logger::error(LogCategory::TRANSFER, "TableMigrator", e.what());
    tracker_.status(table.name, TableStatus::FAILED, e.what());
  } catch (const WriteError &e) {
    Logger::error(LogCategory::TRANSFER, "TableMigrator", e.what());
    tracker_.status(table.name, TableStatus::FAILED, e.what());
  } catch (const std::exception &e) {
    std::string detail = "Unexpected error migrating " + table.name + ": " +
                         std::string(e.what());
    Logger::error(LogCategory::TRANSFER, "TableMigrator", detail);
    tracker_.status(table.name, TableStatus::FAILED, detail);
  }

  TableResult result = tracker_.result(table.name);
  Logger::info(LogCategory::TRANSFER, "TableMigrator",
               table.name + " " + tableStatusToString(result.status) + " with " +
                   std::to_string(result.rowsMigrated) + " rows in " +
                   std::to_string(result.durationSeconds()) + "s");
  return result;
}
