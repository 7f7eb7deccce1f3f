#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace probedge {

// -----------------------------------------------------------------------------
// CancellationToken: best-effort cancellation signal for collaborator calls
// -----------------------------------------------------------------------------
//
// @brief  Shared flag the EvaluationScheduler raises when a market's
//         deadline expires. Collaborators poll it (or wait on it) and give up
//         early.
//
// @details
// Copies share the same state. The scheduler keeps one copy, the abandoned
// collaborator call keeps another; the shared state lives until both are
// gone, so a late collaborator never touches freed memory.
//
// Cancellation is cooperative. A collaborator that ignores the token simply
// runs to completion on its own thread and its result is discarded.
//
// wait_for() doubles as an interruptible sleep: collaborators with retry
// back-off or polling loops use it instead of std::this_thread::sleep_for so
// that cancel() wakes them immediately.
//
// Thread model: every method is safe from any thread.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void cancel() const {
    {
      std::lock_guard lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool cancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  // -------------------------------------------------------------------------
  // wait_for(timeout)
  // -------------------------------------------------------------------------
  // Blocks for up to timeout. Returns true if the token was cancelled
  // (possibly before the call), false if the full timeout elapsed.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout,
                               [this] { return state_->cancelled; });
  }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
  };

  std::shared_ptr<State> state_;
};

}  // namespace probedge
