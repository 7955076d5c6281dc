#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace batchsync::transfer {

/*
  One-way stop signal shared by the coordinator and its workers.

  Workers poll IsCancelled() at file boundaries; WaitFor() is an
  interruptible sleep for retry backoff.
*/
class CancellationToken {
 public:
  void Cancel() {
    {
      std::lock_guard lock(mutex_);
      cancelled_.store(true);
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

  // True if cancelled before the delay elapsed.
  bool WaitFor(std::chrono::milliseconds delay) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, delay, [this] { return cancelled_.load(); });
  }

 private:
  std::atomic<bool>       cancelled_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace batchsync::transfer
