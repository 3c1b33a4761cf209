#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using rwd::core::ThreadPool;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, ReturnsTaskResults) {
  ThreadPool tp(2);
  auto futA = tp.submit([]() { return 21 * 2; });
  auto futB = tp.submit([](int a, int b) { return a + b; }, 3, 4);
  EXPECT_EQ(futA.get(), 42);
  EXPECT_EQ(futB.get(), 7);
}

TEST(ThreadPoolTest, RunsTasksConcurrently) {
  ThreadPool tp(4);
  std::atomic<int> iActive{0};
  std::atomic<int> iPeak{0};

  std::vector<std::future<void>> vFutures;
  for (int i = 0; i < 4; ++i) {
    vFutures.push_back(tp.submit([&iActive, &iPeak]() {
      const int iNow = ++iActive;
      int iPrev = iPeak.load();
      while (iNow > iPrev && !iPeak.compare_exchange_weak(iPrev, iNow)) {
      }
      std::this_thread::sleep_for(100ms);
      --iActive;
    }));
  }
  for (auto& fut : vFutures) fut.get();

  EXPECT_GT(iPeak.load(), 1);
}

TEST(ThreadPoolTest, ExceptionPropagatesThroughFuture) {
  ThreadPool tp(1);
  auto fut = tp.submit([]() -> int { throw std::runtime_error("task failed"); });
  EXPECT_THROW(fut.get(), std::runtime_error);

  // Worker survives the failed task
  auto futNext = tp.submit([]() { return 1; });
  EXPECT_EQ(futNext.get(), 1);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedWork) {
  std::atomic<int> iDone{0};
  {
    ThreadPool tp(1);
    for (int i = 0; i < 10; ++i) {
      tp.submit([&iDone]() {
        std::this_thread::sleep_for(1ms);
        ++iDone;
      });
    }
    tp.shutdown();
  }
  EXPECT_EQ(iDone.load(), 10);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
  ThreadPool tp(1);
  tp.shutdown();
  tp.shutdown();  // idempotent
  EXPECT_THROW(tp.submit([]() { return 0; }), std::runtime_error);
}

TEST(ThreadPoolTest, ReportsSize) {
  ThreadPool tp(3);
  EXPECT_EQ(tp.size(), 3);
}
