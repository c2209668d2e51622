#pragma once

#include <cstddef>    // for std::size_t
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min

#include "IParallelExecutor.h"

namespace treestat
{
  namespace concurrency
  {
    // Split [0…total) into at most numWorkers() contiguous chunks, submit each
    // chunk to exec.submit, waitAll, and internally loop i from chunk.start to
    // chunk.end calling body(i).
    //
    // body(i) must only write to slot i of caller-owned storage; that is what
    // makes the result independent of the number of workers.
    template<typename Body>
    void parallel_for(std::size_t total, IParallelExecutor& exec, Body body)
    {
      if (total == 0) return;

      const std::size_t numTasks  = std::max<std::size_t>(1, exec.numWorkers());
      const std::size_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

      std::vector<std::future<void>> futures;
      futures.reserve(numTasks);
      for (std::size_t start = 0; start < total; start += chunkSize)
	{
	  const std::size_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(exec.submit([&body, start, end]() {
		for (std::size_t i = start; i < end; ++i) {
		  body(i);
		}
	      }));
	}
      exec.waitAll(futures);
    }

    template<typename Container, typename Body>
    void parallel_for_each(IParallelExecutor& exec, const Container& container, Body body)
    {
      parallel_for(container.size(), exec, [&container, &body](std::size_t i) {
	  body(container[i]);
	});
    }
  }
}
