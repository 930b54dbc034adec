#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to run batches of hypothesis tests.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - ThreadPoolExecutor: a fixed-size pool of worker threads sized at construction.
 *
 * SingleThreadExecutor is what the engine uses when the configured thread
 * count is 1 and in unit tests that need a reproducible order.
 */
namespace hypotest
{
  namespace concurrency
  {
    // hardware_concurrency(), or 2 when the platform cannot tell
    inline std::size_t getDefaultThreadCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    /**
     * @brief Executes tasks synchronously on the calling thread.
     */
    class SingleThreadExecutor : public IParallelExecutor {
    public:
      std::future<void> submit(std::function<void()> task) override {
        std::promise<void> prom;
        auto fut = prom.get_future();
        try {
          task();
          prom.set_value();
        } catch (...) {
          prom.set_exception(std::current_exception());
        }
        return fut;
      }

      std::size_t getNumThreads() const override { return 1; }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * Submitted tasks are queued and executed by the worker threads in FIFO
     * order. A thread count of 0 picks getDefaultThreadCount(). The destructor
     * drains the queue before joining the workers.
     */
    class ThreadPoolExecutor : public IParallelExecutor {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      explicit ThreadPoolExecutor(std::size_t numThreads = 0)
        : mStop(false)
      {
        const std::size_t threads = numThreads > 0 ? numThreads : getDefaultThreadCount();

        try {
          for (std::size_t i = 0; i < threads; ++i) {
            mWorkers.emplace_back([this] { workerLoop(); });
          }
        }
        catch (...) {
          {
            std::lock_guard<std::mutex> lock(mTasksMutex);
            mStop = true;
          }
          mCondition.notify_all();
          for (auto& w : mWorkers) if (w.joinable()) w.join();
          throw;
        }
      }

      ~ThreadPoolExecutor()
      {
        {
          std::unique_lock<std::mutex> lock(mTasksMutex);
          mStop = true;
        }
        mCondition.notify_all();
        for (auto& worker : mWorkers) {
          if (worker.joinable())
            worker.join();
        }
      }

      std::future<void> submit(std::function<void()> task) override
      {
        auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
        auto fut = packaged->get_future();
        {
          std::unique_lock<std::mutex> lock(mTasksMutex);
          if (mStop)
            throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
          mTasks.emplace([packaged]() { (*packaged)(); });
        }
        mCondition.notify_one();
        return fut;
      }

      std::size_t getNumThreads() const override { return mWorkers.size(); }

    private:
      void workerLoop()
      {
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(mTasksMutex);
            mCondition.wait(lock, [this]{ return mStop || !mTasks.empty(); });
            if (mStop && mTasks.empty()) return;
            task = std::move(mTasks.front());
            mTasks.pop();
          }
          task();
        }
      }

      std::vector<std::thread>          mWorkers;
      std::queue<std::function<void()>> mTasks;
      std::mutex                        mTasksMutex;
      std::condition_variable           mCondition;
      bool                              mStop;
    };

    // ThreadPoolExecutor for numThreads != 1, SingleThreadExecutor otherwise
    inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t numThreads)
    {
      if (numThreads == 1)
        return std::make_unique<SingleThreadExecutor>();
      return std::make_unique<ThreadPoolExecutor>(numThreads);
    }
  }
}
