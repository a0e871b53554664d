#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

template <typename T> class ThreadSafeQueue {
private:
  std::mutex mtx;
  std::deque<T> queue;
  std::condition_variable cv;
  bool finished = false;

public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      queue.push_back(std::move(item));
    }
    cv.notify_one();
  }

  // Blocks until an item arrives. Returns false once finish() was called and
  // the queue has been drained.
  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || finished; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop_front();
    return true;
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      finished = true;
    }
    cv.notify_all();
  }
};

#endif
