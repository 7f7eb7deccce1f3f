#include "probedge/concurrent/worker_pool.hpp"

#include <utility>

namespace probedge {

// -----------------------------------------------------------------------------
// Constructor: spawn the workers. A size of 0 would deadlock every caller
// that waits on submitted work, so it is bumped to 1.
// -----------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t size) {
  const std::size_t count = size == 0 ? 1 : size;
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(Task task) { return tasks_.push(std::move(task)); }

// -----------------------------------------------------------------------------
// shutdown(): close, drain, join
// -----------------------------------------------------------------------------
void WorkerPool::shutdown() {
  tasks_.close();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop. pop() returns nullopt only once the queue is closed and
// empty, which is the exit condition.
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (auto task = tasks_.pop()) {
    (*task)();
  }
}

}  // namespace probedge
