#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace hypotest::concurrency;

// Helper function to create a simple task that increments a counter
auto createIncrementTask(std::atomic<int>& counter) {
  return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
}

// Helper function to create a task that throws an exception
auto createThrowingTask(const std::string& message) {
  return [message]() { throw std::runtime_error(message); };
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Basic task execution")
  {
    std::atomic<int> counter{0};
    auto future = executor.submit(createIncrementTask(counter));

    REQUIRE_NOTHROW(future.get());
    REQUIRE(counter.load() == 1);
  }

  SECTION("Task executes immediately")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Multiple tasks execute in order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i) {
      futures.push_back(executor.submit([&results, i]() { results.push_back(i); }));
    }
    executor.waitAll(futures);

    REQUIRE(results == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Exception propagation through future")
  {
    auto future = executor.submit(createThrowingTask("specific error"));

    try {
      future.get();
      FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
      REQUIRE(std::string(e.what()) == "specific error");
    }
  }

  SECTION("Reports one thread")
  {
    REQUIRE(executor.getNumThreads() == 1);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Sized at construction")
  {
    ThreadPoolExecutor executor(3);
    REQUIRE(executor.getNumThreads() == 3);
  }

  SECTION("Zero picks the hardware default")
  {
    ThreadPoolExecutor executor(0);
    REQUIRE(executor.getNumThreads() == getDefaultThreadCount());
    REQUIRE(executor.getNumThreads() >= 1);
  }

  SECTION("Concurrency is capped by the pool size")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> running{0};
    std::atomic<int> maxConcurrent{0};
    std::vector<std::future<void>> futures;

    auto task = [&running, &maxConcurrent]() {
      const int now = running.fetch_add(1) + 1;
      int seen = maxConcurrent.load();
      while (now > seen && !maxConcurrent.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      running.fetch_sub(1);
    };

    for (int i = 0; i < 8; ++i) {
      futures.push_back(executor.submit(task));
    }
    executor.waitAll(futures);

    REQUIRE(maxConcurrent.load() >= 1);
    REQUIRE(maxConcurrent.load() <= 4);
  }

  SECTION("Exceptions from different tasks stay with their futures")
  {
    ThreadPoolExecutor executor(2);
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i) {
      if (i % 2 == 0)
        futures.push_back(executor.submit(createThrowingTask("error")));
      else
        futures.push_back(executor.submit([]() {}));
    }

    REQUIRE_THROWS_AS(futures[0].get(), std::runtime_error);
    REQUIRE_NOTHROW(futures[1].get());
    REQUIRE_THROWS_AS(futures[2].get(), std::runtime_error);
    REQUIRE_NOTHROW(futures[3].get());
    REQUIRE_THROWS_AS(futures[4].get(), std::runtime_error);
  }

  SECTION("Single thread pool processes tasks sequentially")
  {
    ThreadPoolExecutor executor(1);
    std::vector<int> executionOrder;
    std::mutex orderMutex;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 10; ++i) {
      futures.push_back(executor.submit([&executionOrder, &orderMutex, i]() {
        std::lock_guard<std::mutex> lock(orderMutex);
        executionOrder.push_back(i);
      }));
    }
    executor.waitAll(futures);

    REQUIRE(executionOrder.size() == 10);
    REQUIRE(std::is_sorted(executionOrder.begin(), executionOrder.end()));
  }

  SECTION("Destructor waits for pending tasks")
  {
    std::atomic<int> counter{0};
    {
      ThreadPoolExecutor executor(2);
      for (int i = 0; i < 10; ++i) {
        executor.submit([&counter]() {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
          counter.fetch_add(1);
        });
      }
    }
    REQUIRE(counter.load() == 10);
  }
}

TEST_CASE("waitAll waits for every task before rethrowing", "[IParallelExecutor][waitAll]")
{
  ThreadPoolExecutor executor(2);
  std::atomic<int> finished{0};
  std::vector<std::future<void>> futures;

  futures.push_back(executor.submit(createThrowingTask("first")));
  for (int i = 0; i < 6; ++i) {
    futures.push_back(executor.submit([&finished]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      finished.fetch_add(1);
    }));
  }
  futures.push_back(executor.submit(createThrowingTask("second")));

  try {
    executor.waitAll(futures);
    FAIL("expected an exception");
  } catch (const std::runtime_error& e) {
    REQUIRE(std::string(e.what()) == "first");
  }
  REQUIRE(finished.load() == 6);
}

TEST_CASE("makeExecutor picks the policy from the thread count", "[Executor][factory]")
{
  auto single = makeExecutor(1);
  REQUIRE(dynamic_cast<SingleThreadExecutor*>(single.get()) != nullptr);

  auto pool = makeExecutor(3);
  REQUIRE(dynamic_cast<ThreadPoolExecutor*>(pool.get()) != nullptr);
  REQUIRE(pool->getNumThreads() == 3);

  auto hardware = makeExecutor(0);
  REQUIRE(hardware->getNumThreads() == getDefaultThreadCount());
}
