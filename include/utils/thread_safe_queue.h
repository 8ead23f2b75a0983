#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <condition_variable>
#include <mutex>
#include <queue>

// FIFO handed between the thread that submits work and the workers. After
// finish() no more items are expected; consumers drain what is left and then
// see false from popBlocking().
template <typename T> class ThreadSafeQueue {
private:
  mutable std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  bool finished = false;

public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      queue.push(std::move(item));
    }
    cv.notify_one();
  }

  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || finished; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop();
    return true;
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      finished = true;
    }
    cv.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
  }
};

#endif
