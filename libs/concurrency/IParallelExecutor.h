#pragma once

#include <functional>
#include <future>
#include <string>
#include <vector>

namespace concurrency
{
  /**
   * @brief Policy interface for running independent tasks.
   *
   * Every task is handed back as a std::future<void>. An exception thrown
   * by the task is stored in that future and rethrown by get().
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that may run at the same time
    virtual std::size_t getConcurrency() const = 0;

    virtual std::string getName() const = 0;

    /**
     * @brief Wait for every future, then rethrow the first stored exception.
     *
     * Unlike a plain loop of get() calls this never returns while a task
     * is still running, so callers may safely destroy state the tasks use.
     */
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      for (auto& f : futures)
	if (f.valid())
	  f.wait();

      for (auto& f : futures)
	if (f.valid())
	  f.get();
    }
  };
} // namespace concurrency
