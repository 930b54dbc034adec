// concurrency/IParallelExecutor.h
#pragma once
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace hypotest
{
  namespace concurrency
  {
    class IParallelExecutor {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; returns a std::future you can wait on.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Number of tasks that can make progress at the same time.
      virtual std::size_t getNumThreads() const = 0;

      // Wait on every future, then rethrow the first stored exception.
      // No task is still running when this returns or throws.
      virtual void waitAll(std::vector<std::future<void>>& futures) {
        std::exception_ptr first;
        for (auto& f : futures) {
          try {
            f.get();
          }
          catch (...) {
            if (!first)
              first = std::current_exception();
          }
        }
        if (first)
          std::rethrow_exception(first);
      }
    };
  }
}
