#ifndef PARALLELPROCESSING_H
#define PARALLELPROCESSING_H

#include <condition_variable>
#include <mutex>
#include <queue>

// Multi-producer, multi-consumer queue. After finish(), consumers drain what
// is left and popBlocking then returns false.
template <typename T> class ThreadSafeQueue {
private:
  std::mutex mtx_;
  std::queue<T> items_;
  std::condition_variable cv_;
  bool finished_ = false;

public:
  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.push(std::move(item));
    cv_.notify_one();
  }

  void finish() {
    std::lock_guard<std::mutex> lock(mtx_);
    finished_ = true;
    cv_.notify_all();
  }

  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return !items_.empty() || finished_; });
    if (items_.empty())
      return false;
    item = std::move(items_.front());
    items_.pop();
    return true;
  }
};

#endif // PARALLELPROCESSING_H
