#ifndef TABLE_MIGRATOR_H
#define TABLE_MIGRATOR_H

#include "engines/connection_provider.h"
#include "migration/cancellation_token.h"
#include "migration/migration_types.h"
#include "migration/progress_tracker.h"

// Drives one table from PENDING to a terminal status: read a batch, write it,
// record it, repeat until the source is exhausted. A read or write failure
// ends the table as FAILED with no retry; cancellation is honoured only
// between batches so a batch is never half-counted.
class TableMigrator {
private:
  IConnectionProvider &provider_;
  ProgressTracker &tracker_;
  const CancellationToken &cancelToken_;

public:
  TableMigrator(IConnectionProvider &provider, ProgressTracker &tracker,
                const CancellationToken &cancelToken);

  TableResult migrate(const TableSpec &table, ISession &source,
                      ISession &target, size_t batchSize);
};

#endif
