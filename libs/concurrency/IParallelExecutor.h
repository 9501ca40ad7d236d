#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; the returned future carries its exception, if any.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that can run at the same time
    virtual std::size_t getNumWorkers() const = 0;

    /**
     * Waits for every future, then rethrows the first exception seen.
     * No task is still running when this returns or throws.
     */
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr firstError;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!firstError)
		firstError = std::current_exception();
	    }
	}

      if (firstError)
	std::rethrow_exception(firstError);
    }
  };
} // namespace concurrency
