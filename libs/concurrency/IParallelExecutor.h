// concurrency/IParallelExecutor.h
#pragma once
#include <future>
#include <vector>
#include <functional>
#include <exception>

namespace treestat
{
  namespace concurrency
  {
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; returns a std::future you can wait on.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Number of tasks that can run at the same time.
      virtual std::size_t numWorkers() const = 0;

      // Wait on every future, then rethrow the first captured exception.
      // All futures are drained before rethrowing so that no task is still
      // touching caller-owned state when the exception leaves this call.
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
}
