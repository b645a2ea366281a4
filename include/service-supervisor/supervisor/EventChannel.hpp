#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>

namespace svcsup {

/// Multi-producer, single-consumer queue. Producers never block.
template <typename T> class EventChannel {
public:
  /// Returns false once the channel is closed
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /// Blocks until an item is available. Returns false when the channel is
  /// closed and drained.
  bool pop(T &out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty())
      return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

} // namespace svcsup
