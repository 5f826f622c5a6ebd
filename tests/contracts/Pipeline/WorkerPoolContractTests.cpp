// Repository: Redub
// Component: WorkerPool Contract Tests
// Copyright (c) 2026 Redub

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "redub/pipeline/WorkerPool.hpp"

using redub::pipeline::WorkerPool;

TEST(WorkerPoolContract, RunsEverySubmittedTask) {
  WorkerPool pool(4);
  std::atomic<int> done{0};
  for (int i = 0; i < 100; ++i) {
    pool.Submit([&done] { done.fetch_add(1); });
  }
  pool.WaitIdle();
  EXPECT_EQ(done.load(), 100);
  EXPECT_EQ(pool.thread_count(), 4u);
}

TEST(WorkerPoolContract, ZeroThreadsStillGetsOneWorker) {
  WorkerPool pool(0);
  EXPECT_EQ(pool.thread_count(), 1u);
  bool ran = false;
  pool.Submit([&ran] { ran = true; });
  pool.WaitIdle();
  EXPECT_TRUE(ran);
}

TEST(WorkerPoolContract, ConcurrencyIsBoundedByThreadCount) {
  WorkerPool pool(2);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  for (int i = 0; i < 8; ++i) {
    pool.Submit([&] {
      const int now = running.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      running.fetch_sub(1);
    });
  }
  pool.WaitIdle();
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolContract, FirstTaskExceptionIsRethrownOnce) {
  WorkerPool pool(1);
  std::atomic<int> done{0};
  pool.Submit([] { throw std::runtime_error("first"); });
  pool.Submit([] { throw std::runtime_error("second"); });
  pool.Submit([&done] { done.fetch_add(1); });
  try {
    pool.WaitIdle();
    FAIL() << "expected rethrow";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "first");
  }
  EXPECT_EQ(done.load(), 1);
  EXPECT_NO_THROW(pool.WaitIdle());
}

TEST(WorkerPoolContract, CancelDropsPendingTasks) {
  WorkerPool pool(1);
  std::atomic<bool> release{false};
  std::atomic<bool> started{false};
  std::atomic<int> done{0};
  pool.Submit([&] {
    started = true;
    while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  });
  for (int i = 0; i < 5; ++i) pool.Submit([&done] { done.fetch_add(1); });

  while (!started.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  EXPECT_EQ(pool.Cancel(), 5u);
  release = true;
  pool.WaitIdle();
  EXPECT_EQ(done.load(), 0);
}
