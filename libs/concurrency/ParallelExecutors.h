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
 * @brief Executor policies used by the archetype batch to process
 *        metro x role cells.
 *
 *  - SingleThreadExecutor: runs each task inline on the caller's thread.
 *    Used by the unit tests and by `--threads 1` runs.
 *  - ThreadPoolExecutor: a fixed pool of workers draining a FIFO queue.
 *    Cells are CPU-bound Monte Carlo work, so the pool is sized to the
 *    hardware unless a thread count is given.
 */
namespace concurrency
{
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try
	{
	  task();
	  prom.set_value();
	}
      catch (...)
	{
	  prom.set_exception(std::current_exception());
	}
      return fut;
    }
  };

  /**
   * @brief Fixed-size worker pool.
   *
   * A thread count of zero selects std::thread::hardware_concurrency()
   * (two when the platform cannot report it). Tasks still queued when the
   * pool is destroyed are drained before the workers exit.
   */
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : mStop(false)
    {
      std::size_t threads = numThreads;
      if (threads == 0)
	{
	  const unsigned hw = std::thread::hardware_concurrency();
	  threads = hw ? hw : 2;
	}

      try
	{
	  for (std::size_t i = 0; i < threads; ++i)
	    mWorkers.emplace_back([this] { workerLoop(); });
	}
      catch (...)
	{
	  shutdown();
	  throw;
	}
    }

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	if (mStop)
	  throw std::runtime_error("ThreadPoolExecutor: submit after shutdown");
	mTasks.emplace([packaged]() { (*packaged)(); });
      }
      mCondition.notify_one();
      return fut;
    }

    std::size_t getNumThreads() const
    {
      return mWorkers.size();
    }

  private:
    void workerLoop()
    {
      for (;;)
	{
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(mQueueMutex);
	    mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });
	    if (mStop && mTasks.empty())
	      return;
	    task = std::move(mTasks.front());
	    mTasks.pop();
	  }
	  task();
	}
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	mStop = true;
      }
      mCondition.notify_all();
      for (auto& w : mWorkers)
	if (w.joinable())
	  w.join();
    }

    std::vector<std::thread>          mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex                        mQueueMutex;
    std::condition_variable           mCondition;
    bool                              mStop;
  };
} // namespace concurrency
