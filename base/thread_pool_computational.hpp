#pragma once

#include "base/assert.hpp"
#include "base/macros.hpp"

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace base
{
namespace thread_pool
{
namespace computational
{
// ThreadPool is needed for easy parallelization of tasks.
// ThreadPool can accept tasks that return result as std::future.
// When the destructor is called, all threads will join.
class ThreadPool
{
public:
  using FunctionType = std::function<void()>;
  using Threads = std::vector<std::thread>;

  // Constructs a ThreadPool.
  // threadCount - number of threads used by the thread pool.
  // Warning: The constructor may throw exceptions.
  explicit ThreadPool(size_t threadCount = std::thread::hardware_concurrency())
    : m_done(false)
  {
    CHECK_GREATER(threadCount, 0, ());

    m_threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i)
      m_threads.emplace_back(&ThreadPool::Worker, this);
  }

  // Destroys the ThreadPool.
  // This function will block until all runnable tasks are completed.
  ~ThreadPool() { WaitAndStop(); }

  // Submits task (function) with arguments to the thread pool.
  // It returns std::future, so the result of the task can be received.
  // Exceptions thrown from the task are delivered through the future.
  template <typename F, typename... Args>
  auto Submit(F && func, Args &&... args) -> std::future<std::result_of_t<F(Args...)>>
  {
    using ResultType = std::result_of_t<F(Args...)>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    std::future<ResultType> result(task->get_future());
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_queue.emplace([task]() { (*task)(); });
    }
    m_condition.notify_one();
    return result;
  }

  // Waits for all queued tasks to complete and then stops all threads.
  void WaitAndStop()
  {
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_done = true;
    }
    m_condition.notify_all();
    JoinAll();
  }

  size_t Size() const noexcept { return m_threads.size(); }

private:
  void Worker()
  {
    while (true)
    {
      FunctionType task;
      {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [&] { return m_done || !m_queue.empty(); });

        if (m_queue.empty())
          return;

        task = std::move(m_queue.front());
        m_queue.pop();
      }

      task();
    }
  }

  void JoinAll()
  {
    for (auto & t : m_threads)
    {
      if (t.joinable())
        t.join();
    }
  }

  bool m_done;
  std::mutex m_mutex;
  std::condition_variable m_condition;
  std::queue<FunctionType> m_queue;
  Threads m_threads;

  DISALLOW_COPY_AND_MOVE(ThreadPool);
};
}  // namespace computational
}  // namespace thread_pool
}  // namespace base
