#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <atomic>

// Cooperative stop flag shared by the orchestrator and its table workers.
// Workers only look at it between batches.
class CancellationToken {
private:
  std::atomic<bool> cancelled_{false};

public:
  void cancel() { cancelled_.store(true); }
  bool isCancelled() const { return cancelled_.load(); }
};

#endif
