#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace sitepull::transfer {

/*
  Thread-safe blocking queue shared by retrieval workers and the collector.
*/
template <typename T>
class WorkQueue {
 public:
  void Push(T item) {
    {
      std::lock_guard lock(mutex_);
      queue_.push(std::move(item));
    }
    cv_.notify_one();
  }

  // blocking wait; nullopt once closed and drained
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    closed_ = false;
};

} // namespace sitepull::transfer
