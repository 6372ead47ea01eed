// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_UTIL_THREADPOOL_HPP
#define LUNACHAIN_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace lunachain {
namespace util {

/**
 * Fixed-size worker pool for block validation
 *
 * RunChecks spreads a batch of independent boolean checks (transaction
 * signatures) over the workers and waits for the whole batch. enqueue runs a
 * single task and hands its result back through a future.
 */
class ThreadPool {
public:
  // num_threads == 0 uses hardware concurrency
  explicit ThreadPool(size_t num_threads = 0);

  // Finishes queued tasks, then joins the workers
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  template <class F>
  std::future<std::invoke_result_t<F>> enqueue(F &&f);

  /**
   * Run every check and wait for all of them.
   *
   * @return lowest index whose check returned false, or nullopt if all passed
   */
  std::optional<size_t> RunChecks(const std::vector<std::function<bool()>> &checks);

  size_t size() const { return workers_.size(); }

private:
  void Post(std::function<void()> task);
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> tasks_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_{false};
};

template <class F>
std::future<std::invoke_result_t<F>> ThreadPool::enqueue(F &&f) {
  using R = std::invoke_result_t<F>;
  auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
  std::future<R> result = task->get_future();
  Post([task]() { (*task)(); });
  return result;
}

} // namespace util
} // namespace lunachain

#endif // LUNACHAIN_UTIL_THREADPOOL_HPP
