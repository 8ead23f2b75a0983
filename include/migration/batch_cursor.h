#ifndef BATCH_CURSOR_H
#define BATCH_CURSOR_H

#include "engines/connection_provider.h"
#include <string>

// Sequential read position over one table. Owned by a single Table Migrator
// and never reused for another table. Reading does not move the position;
// advance() commits a fetch once its rows have been written, so a batch that
// fails to write is never skipped.
class BatchCursor {
private:
  IConnectionProvider &provider_;
  std::string tableName_;
  CursorToken position_;
  bool exhausted_ = false;
  size_t batchesRead_ = 0;

public:
  BatchCursor(IConnectionProvider &provider, std::string tableName);

  BatchCursor(const BatchCursor &) = delete;
  BatchCursor &operator=(const BatchCursor &) = delete;

  // Throws ReadError. An empty batch marks the cursor exhausted.
  FetchResult next(ISession &session, size_t size);
  void advance(const FetchResult &fetched);

  bool exhausted() const { return exhausted_; }
  const CursorToken &position() const { return position_; }
  const std::string &tableName() const { return tableName_; }
  size_t batchesRead() const { return batchesRead_; }
};

#endif
