#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Interface for the executor policies that run independent tasks.
   *
   * Tasks report completion and exceptions through the returned future.
   */
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that can make progress at the same time
    virtual std::size_t numWorkers() const = 0;

    /**
     * @brief Wait for every future, then rethrow the first exception seen.
     *
     * All futures are drained before rethrowing so that no task is still
     * running when the caller unwinds state the tasks refer to.
     */
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
