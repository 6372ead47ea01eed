// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include <algorithm>
#include <atomic>
#include <limits>
#include <stdexcept>

namespace lunachain {
namespace util {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::max(1u, std::thread::hardware_concurrency());
  }
  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] { WorkerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (std::thread &worker : workers_) {
    worker.join();
  }
}

void ThreadPool::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw std::runtime_error("ThreadPool is shutting down");
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void ThreadPool::WorkerLoop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        return; // stopping and drained
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    task();
  }
}

std::optional<size_t>
ThreadPool::RunChecks(const std::vector<std::function<bool()>> &checks) {
  if (checks.empty()) {
    return std::nullopt;
  }

  constexpr size_t NONE = std::numeric_limits<size_t>::max();

  // Workers claim indices from a shared cursor until the batch is exhausted.
  // Every check runs even after a failure, so the reported index does not
  // depend on scheduling.
  struct Batch {
    std::atomic<size_t> next{0};
    std::atomic<size_t> first_failure{NONE};
    std::mutex mutex;
    std::condition_variable done_cv;
    size_t runners_left{0};
  } batch;

  auto runner = [&checks, &batch]() {
    for (size_t i = batch.next.fetch_add(1); i < checks.size();
         i = batch.next.fetch_add(1)) {
      if (!checks[i]()) {
        size_t current = batch.first_failure.load();
        while (i < current &&
               !batch.first_failure.compare_exchange_weak(current, i)) {
        }
      }
    }
    std::lock_guard<std::mutex> lock(batch.mutex);
    if (--batch.runners_left == 0) {
      batch.done_cv.notify_one();
    }
  };

  const size_t runners = std::min(workers_.size(), checks.size());
  batch.runners_left = runners;
  for (size_t i = 0; i < runners; ++i) {
    Post(runner);
  }

  std::unique_lock<std::mutex> lock(batch.mutex);
  batch.done_cv.wait(lock, [&batch] { return batch.runners_left == 0; });

  size_t failed = batch.first_failure.load();
  if (failed == NONE) {
    return std::nullopt;
  }
  return failed;
}

} // namespace util
} // namespace lunachain
