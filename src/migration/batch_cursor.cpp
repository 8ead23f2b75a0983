#include "migration/batch_cursor.h"
#include "core/errors.h"
#include "core/logger.h"

BatchCursor::BatchCursor(IConnectionProvider &provider, std::string tableName)
    : provider_(provider), tableName_(std::move(tableName)) {}

FetchResult BatchCursor::next(ISession &session, size_t size) {
  if (exhausted_) {
    return FetchResult{RowBatch{}, position_, true};
  }

  FetchResult fetched =
      provider_.fetchBatch(session, tableName_, position_, size);
  batchesRead_++;

  if (fetched.batch.size() > size) {
    throw ReadError(tableName_, "provider returned " +
                                    std::to_string(fetched.batch.size()) +
                                    " rows for a batch of " +
                                    std::to_string(size));
  }

  if (fetched.batch.empty()) {
    exhausted_ = true;
    fetched.exhausted = true;
    Logger::debug(LogCategory::TRANSFER, "BatchCursor::next",
                  tableName_ + " exhausted after " +
                      std::to_string(batchesRead_ - 1) + " batches");
  }
  return fetched;
}

void BatchCursor::advance(const FetchResult &fetched) {
  if (exhausted_)
    return;
  position_ = fetched.next;
  if (fetched.exhausted)
    exhausted_ = true;
}
