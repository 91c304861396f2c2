#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Policy interface for running independent units of batch work.
   *
   * Each submitted task is a void() callable. Exceptions raised inside a task
   * are delivered through the returned future, so the caller decides whether
   * a failing task aborts the batch or is merely recorded.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Blocks until every future is ready, then rethrows the first stored
    // exception. Tasks may reference the caller's stack, so none may still be
    // running when this returns.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr first;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!first)
		first = std::current_exception();
	    }
	}

      if (first)
	std::rethrow_exception(first);
    }
  };
}
