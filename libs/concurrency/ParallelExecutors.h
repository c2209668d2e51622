#pragma once

#include "IParallelExecutor.h"
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <queue>
#include <mutex>
#include <memory>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to evaluate independent numerical tasks.
 *
 * Two implementations of the IParallelExecutor interface are provided:
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - ThreadPoolExecutor: a fixed-size thread pool whose size is chosen at construction.
 *
 * @section usage Guidance on choosing an executor policy
 * - SingleThreadExecutor: nCores == 1, unit tests, debugging, or whenever the
 *   user function is not safe to call from several threads.
 * - ThreadPoolExecutor: nCores > 1. Threads are created once per pool and reused
 *   for every task, so the many short finite-difference evaluations of a
 *   derivative call do not pay thread start-up cost each time.
 *
 * Callers normally obtain an executor through makeExecutor(nCores).
 */
namespace treestat
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     *
     * All tasks run inline, with no actual concurrency. Exceptions thrown by
     * a task are captured in the returned future, exactly as a pooled
     * executor would report them.
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
	} catch (...) {
	  prom.set_exception(std::current_exception());
	}
	return fut;
      }

      std::size_t numWorkers() const override
      {
	return 1;
      }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * Tasks submitted are queued and executed by a pool of worker threads.
     * The number of workers is fixed for the lifetime of the pool.
     *
     * If numThreads == 0, we pick std::thread::hardware_concurrency()
     * (falling back to 2 if that returns 0).
     */
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      explicit ThreadPoolExecutor(std::size_t numThreads = 0)
	: stop_(false)
      {
	const std::size_t threads =
	  numThreads > 0 ? numThreads
	  : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

	try {
	  for (std::size_t i = 0; i < threads; ++i) {
	    workers_.emplace_back([this] { workerLoop(); });
	  }
	}
	catch (...) {
	  {
	    std::lock_guard<std::mutex> lock(tasksMutex_);
	    stop_ = true;
	  }
	  condition_.notify_all();
	  for (auto& w : workers_) if (w.joinable()) w.join();
	  throw;
	}
      }

      ~ThreadPoolExecutor()
      {
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  stop_ = true;
	}
	condition_.notify_all();
	for (auto &worker : workers_) {
	  if (worker.joinable())
	    worker.join();
	}
      }

      std::future<void> submit(std::function<void()> task) override
      {
	auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
	auto fut = packaged->get_future();
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  if (stop_)
	    throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	  tasks_.emplace([packaged]() { (*packaged)(); });
	}
	condition_.notify_one();
	return fut;
      }

      std::size_t numWorkers() const override
      {
	return workers_.size();
      }

    private:
      void workerLoop()
      {
	for (;;) {
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(tasksMutex_);
	    condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	    if (stop_ && tasks_.empty()) return;
	    task = std::move(tasks_.front());
	    tasks_.pop();
	  }
	  task();
	}
      }

    private:
      std::vector<std::thread>          workers_;
      std::queue<std::function<void()>> tasks_;
      std::mutex                        tasksMutex_;
      std::condition_variable           condition_;
      bool                              stop_;
    };

    /**
     * @brief Create the executor used for an nCores-wide batch.
     *
     * nCores <= 1 gives a SingleThreadExecutor, so the serial path has no
     * pool overhead at all. Larger values give a pool with exactly nCores
     * workers.
     */
    inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t nCores)
    {
      if (nCores <= 1)
	return std::make_unique<SingleThreadExecutor>();

      return std::make_unique<ThreadPoolExecutor>(nCores);
    }
  } // namespace concurrency
} // namespace treestat
