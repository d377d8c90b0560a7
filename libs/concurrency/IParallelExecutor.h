#pragma once

#include <functional>
#include <future>
#include <vector>

namespace psepower::concurrency
{
  /**
   * @brief Policy interface for running independent replication tasks.
   *
   * Implementations decide where a task runs (inline, pooled worker, ...).
   * Exceptions thrown by a task are delivered through the returned future.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Blocks until every future is ready; rethrows the first stored exception.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      for (auto& f : futures)
	f.get();
    }
  };
} // namespace psepower::concurrency
