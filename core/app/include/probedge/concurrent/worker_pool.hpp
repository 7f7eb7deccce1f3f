#pragma once

#include "probedge/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace probedge {

// -----------------------------------------------------------------------------
// WorkerPool: fixed-size pool of task threads
// -----------------------------------------------------------------------------
//
// @brief  Runs submitted tasks on at most `size` threads. This is the
//         concurrency bound C of the EvaluationScheduler.
//
// @details
// Tasks are std::function<void()> pulled from a shared ThreadSafeQueue. A
// task that throws would terminate the worker thread (and the process), so
// every task submitted by the scheduler catches at its own boundary; the pool
// itself does not swallow anything.
//
// Lifecycle:
//   construct → threads start immediately.
//   shutdown() / destructor → the queue is closed, already-queued tasks are
//   drained, then every thread is joined.
//
// Thread model: submit() is safe from any thread. shutdown() must not be
// called from inside a task.
//
// Ownership: the pool owns its threads and queue; callers own whatever their
// tasks capture and must keep it alive until the task has run.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(std::size_t size);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // Enqueues a task. Returns false if the pool has been shut down.
  bool submit(Task task);

  // Closes the queue, lets workers drain it, joins all threads. Idempotent.
  void shutdown();

  std::size_t size() const { return threads_.size(); }

 private:
  void run();

  ThreadSafeQueue<Task> tasks_;
  std::vector<std::thread> threads_;
};

}  // namespace probedge
