#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
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
 * @brief Executor policies used to run cadence simulations side by side.
 *
 *  - SingleThreadExecutor: runs each task inline on the calling thread.
 *  - StdAsyncExecutor: one std::async(std::launch::async) per task.
 *  - ThreadPoolExecutor: a fixed pool of worker threads fed from a queue.
 *
 * SingleThreadExecutor gives reproducible ordering and is what the tests
 * and the --threads 1 setting use. ThreadPoolExecutor caps the number of
 * simulations in flight, which bounds memory when many cadences are swept.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
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

    std::size_t getConcurrency() const override
    {
      return 1;
    }

    std::string getName() const override
    {
      return "single-thread";
    }
  };

  /**
   * @brief Launches every task with std::async(std::launch::async).
   *
   * There is no upper bound on concurrent tasks, so this suits a handful
   * of long running jobs only.
   */
  class StdAsyncExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      return std::async(std::launch::async, std::move(task));
    }

    std::size_t getConcurrency() const override
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    std::string getName() const override
    {
      return "std-async";
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * A thread count of zero selects std::thread::hardware_concurrency(),
   * falling back to 2 when that is unknown. Queued tasks still run to
   * completion when the pool is destroyed.
   */
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : mStop(false)
    {
      const unsigned hw = std::thread::hardware_concurrency();
      const std::size_t threads = numThreads > 0 ? numThreads : (hw ? hw : 2);

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
	std::unique_lock<std::mutex> lock(mTasksMutex);
	if (mStop)
	  throw std::runtime_error("ThreadPoolExecutor::submit - pool has been stopped");
	mTasks.emplace([packaged]() { (*packaged)(); });
      }
      mCondition.notify_one();
      return fut;
    }

    std::size_t getConcurrency() const override
    {
      return mWorkers.size();
    }

    std::string getName() const override
    {
      return "thread-pool";
    }

  private:
    void workerLoop()
    {
      for (;;)
	{
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(mTasksMutex);
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
	std::lock_guard<std::mutex> lock(mTasksMutex);
	mStop = true;
      }
      mCondition.notify_all();
      for (auto& worker : mWorkers)
	if (worker.joinable())
	  worker.join();
    }

  private:
    std::vector<std::thread> mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex mTasksMutex;
    std::condition_variable mCondition;
    bool mStop;
  };

  /**
   * @brief Executor for a requested degree of parallelism.
   *
   * One thread gives a SingleThreadExecutor, zero means one worker per
   * hardware thread.
   */
  inline std::unique_ptr<IParallelExecutor> createExecutor(std::size_t numThreads)
  {
    if (numThreads == 1)
      return std::unique_ptr<IParallelExecutor>(new SingleThreadExecutor());

    return std::unique_ptr<IParallelExecutor>(new ThreadPoolExecutor(numThreads));
  }
} // namespace concurrency
