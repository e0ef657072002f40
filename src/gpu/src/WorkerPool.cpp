/**
 * @file WorkerPool.cpp
 * @brief Worker thread lifecycle.
 */

#include "src/gpu/inc/WorkerPool.hpp"

#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0) {
    threads = 1;
  }
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
  spdlog::debug("worker pool started with {} thread(s)", threads);
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    worker.join();
  }
}

std::size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void WorkerPool::workerLoop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    // packaged_task stores any exception in its future.
    task();
  }
}

} // namespace gpu

} // namespace gpuinfo
