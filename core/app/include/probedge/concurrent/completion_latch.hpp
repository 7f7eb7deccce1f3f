#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace probedge {

// -----------------------------------------------------------------------------
// CompletionLatch: single-use countdown
// -----------------------------------------------------------------------------
// The EvaluationScheduler arms one latch per chunk with the chunk's size;
// each worker task counts down once when its market's result slot is
// written, and the scheduler thread waits for zero before starting the next
// chunk. (std::latch is C++20; this covers the subset we use.)
// -----------------------------------------------------------------------------
class CompletionLatch {
 public:
  explicit CompletionLatch(std::size_t count) : remaining_(count) {}

  CompletionLatch(const CompletionLatch&) = delete;
  CompletionLatch& operator=(const CompletionLatch&) = delete;

  void count_down() {
    bool reached_zero = false;
    {
      std::lock_guard lock(mutex_);
      if (remaining_ > 0) {
        --remaining_;
        reached_zero = (remaining_ == 0);
      }
    }
    if (reached_zero) {
      cv_.notify_all();
    }
  }

  void wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return remaining_ == 0; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t remaining_;
};

}  // namespace probedge
