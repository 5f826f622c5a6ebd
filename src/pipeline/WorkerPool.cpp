// Repository: Redub
// Component: WorkerPool Implementation
// Copyright (c) 2026 Redub

#include "redub/pipeline/WorkerPool.hpp"

#include <algorithm>
#include <utility>

namespace redub::pipeline {

WorkerPool::WorkerPool(size_t thread_count) {
  const size_t n = std::max<size_t>(1, thread_count);
  workers_.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
    queue_.clear();
  }
  work_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
}

void WorkerPool::WaitIdle() {
  std::exception_ptr error;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
    error = std::move(first_error_);
    first_error_ = nullptr;
  }
  if (error) std::rethrow_exception(error);
}

size_t WorkerPool::Cancel() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = queue_.size();
    queue_.clear();
  }
  idle_cv_.notify_all();
  return dropped;
}

// =============================================================================
// WorkerLoop: persistent thread, waits for tasks
// =============================================================================

void WorkerPool::WorkerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });
      if (shutdown_.load(std::memory_order_acquire)) return;

      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    std::exception_ptr error;
    try {
      task();
    } catch (...) {
      error = std::current_exception();
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (error && !first_error_) first_error_ = error;
    }
    // Wake any thread waiting in WaitIdle().
    idle_cv_.notify_all();
  }
}

}  // namespace redub::pipeline
