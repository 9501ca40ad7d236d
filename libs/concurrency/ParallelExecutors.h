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
#include <system_error>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to run report imports.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Used for
 *    a worker count of one and in unit tests, where it makes execution
 *    deterministic.
 *  - ThreadPoolExecutor: a fixed number of worker threads draining a FIFO
 *    queue. Thread start-up is paid once per import instead of once per file.
 */
namespace concurrency
{
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
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

    std::size_t getNumWorkers() const override {
      return 1;
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * Tasks are queued and executed in submission order by the pool's workers.
   * A thread count of 0 picks std::thread::hardware_concurrency() (falling
   * back to 2 if that returns 0). The destructor drains the queue before
   * joining the workers.
   */
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t numThreads = 0) : stop_(false)
    {
      const std::size_t threads = numThreads > 0 ? numThreads : defaultThreadCount();

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (const std::system_error&) {
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
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t getNumWorkers() const override
    {
      return workers_.size();
    }

    static std::size_t defaultThreadCount()
    {
      const unsigned int hardware = std::thread::hardware_concurrency();
      return hardware ? hardware : 2;
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

    void shutdown()
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

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  // One worker runs inline; anything else gets a pool (0 = hardware concurrency).
  inline std::unique_ptr<IParallelExecutor> createExecutor(std::size_t numWorkers)
  {
    if (numWorkers == 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<ThreadPoolExecutor>(numWorkers);
  }
} // namespace concurrency
