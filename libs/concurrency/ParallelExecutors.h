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
 * @brief Executor policies used to fan power-analysis replications out.
 *
 *  - SingleThreadExecutor: runs every task inline on the calling thread.
 *  - ThreadPoolExecutor<N>: fixed pool of worker threads fed from a FIFO queue.
 *
 * Replications draw from their own random streams, so the choice of executor
 * changes wall-clock time only, never the simulated results.
 */
namespace psepower::concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * Used by the unit tests and by the command-line tool when --threads is 0.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      }
      catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * The pool size is N when N > 0, otherwise the value passed to the
   * constructor; a requested size of 0 selects
   * std::thread::hardware_concurrency() (2 when that is unknown).
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t requestedThreads = N)
      : stop_(false)
    {
      const std::size_t threads = resolveThreadCount(N > 0 ? N : requestedThreads);

      try {
	for (std::size_t i = 0; i < threads; ++i)
	  workers_.emplace_back([this] { workerLoop(); });
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("ThreadPoolExecutor: submit on stopped pool");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t getNumThreads() const noexcept
    {
      return workers_.size();
    }

  private:
    static std::size_t resolveThreadCount(std::size_t requested)
    {
      if (requested > 0)
	return requested;

      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty())
	    return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	// packaged_task stores any exception in its future
	task();
      }
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto& worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace psepower::concurrency
