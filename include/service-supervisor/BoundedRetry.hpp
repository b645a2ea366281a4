#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace svcsup {

/// One-shot cancellation flag whose waits can be interrupted
class CancellationToken {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lk(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lk(mutex_);
    cancelled_ = false;
  }

  bool is_cancelled() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cancelled_;
  }

  /// Sleep for up to `duration`. Returns true if cancelled meanwhile.
  bool wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, duration, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
};

struct RetryPolicy {
  int max_attempts = 1;
  std::chrono::milliseconds interval{0};
};

enum class RetryOutcome { Succeeded, Exhausted, Cancelled };

/// Run `attempt(n)` (n starts at 1) until it returns true, the attempt budget
/// is spent, or `cancel` fires. The interval is waited between attempts only.
template <typename Attempt>
RetryOutcome retry_bounded(const RetryPolicy &policy, Attempt &&attempt,
                           const CancellationToken *cancel = nullptr) {
  for (int n = 1; n <= policy.max_attempts; ++n) {
    if (cancel && cancel->is_cancelled())
      return RetryOutcome::Cancelled;

    if (attempt(n))
      return RetryOutcome::Succeeded;

    if (n == policy.max_attempts || policy.interval.count() <= 0)
      continue;

    if (cancel) {
      if (cancel->wait_for(policy.interval))
        return RetryOutcome::Cancelled;
    } else {
      std::this_thread::sleep_for(policy.interval);
    }
  }
  return RetryOutcome::Exhausted;
}

} // namespace svcsup
