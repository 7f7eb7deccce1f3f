#pragma once

#include "probedge/concurrent/thread_safe_queue.hpp"
#include "probedge/eventbus/event_bus.hpp"
#include "probedge/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace probedge {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Subscribers therefore run
// only on the loop thread, which serializes their work.
//
// The CycleRunner is the main user: a CycleRequestEvent pushed from the
// trigger surface is picked up here, and the cycle runs on this thread. Two
// triggered cycles can never overlap.
//
// Thread model: start(), stop() and push() may be called from any thread.
// Lifecycle: construct, subscribe on eventBus(), start(), push() ..., stop().
// Events still queued when stop() is called are discarded.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. No-op if already running.
  void start();

  // Signals the worker, wakes it, joins. No-op if not running. Must not be
  // called from a subscriber callback (it would join its own thread).
  void stop();

  void push(Event event);

  bool running() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
};

}  // namespace probedge
