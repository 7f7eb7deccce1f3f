#include "probedge/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <optional>
#include <utility>

namespace probedge {

namespace {

// Upper bound on how long an idle loop sleeps before re-checking running_.
// push() and stop() both notify, so this only matters for missed wakeups.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();
}

void EventLoopThread::push(Event event) {
  queue_.push(std::move(event));
  wake_cv_.notify_one();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
// try_pop + timed wait rather than the blocking pop(): the queue stays open
// across stop()/start() cycles, and the loop has to wake on running_ too.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();
    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }
}

}  // namespace probedge
