// Repository: Redub
// Component: WorkerPool
// Purpose: Bounded pool of persistent worker threads for per-segment
//          profiling and backend calls.
// Copyright (c) 2026 Redub

#ifndef REDUB_PIPELINE_WORKER_POOL_HPP_
#define REDUB_PIPELINE_WORKER_POOL_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace redub::pipeline {

// WorkerPool: fixed set of threads draining a FIFO task queue.
//
// Tasks run in submission order as threads become free. An exception thrown
// by a task is captured; the first one is rethrown by the next WaitIdle().
// Cancel() drops tasks that have not started; running tasks finish.
class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(size_t thread_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Enqueue a task; wakes an idle worker.
  void Submit(Task task);

  // Blocks until the queue is empty and no task is running.
  void WaitIdle();

  // Drops pending tasks. Returns how many were dropped.
  size_t Cancel();

  size_t thread_count() const { return workers_.size(); }

 private:
  void WorkerLoop();

  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  size_t active_ = 0;                 // Guarded by mutex_
  std::exception_ptr first_error_;    // Guarded by mutex_

  std::vector<std::thread> workers_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace redub::pipeline

#endif  // REDUB_PIPELINE_WORKER_POOL_HPP_
