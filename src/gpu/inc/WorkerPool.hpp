#ifndef GPUINFO_GPU_WORKER_POOL_HPP
#define GPUINFO_GPU_WORKER_POOL_HPP
/**
 * @file WorkerPool.hpp
 * @brief Fixed-size worker pool for asynchronous GPU queries.
 * @note Explicitly constructed and owned; there is no global pool.
 */

#include <condition_variable> // std::condition_variable
#include <cstddef>            // std::size_t
#include <functional>         // std::function
#include <future>             // std::future, std::packaged_task
#include <memory>             // std::make_shared
#include <mutex>              // std::mutex
#include <queue>              // std::queue
#include <stdexcept>          // std::runtime_error
#include <thread>             // std::thread
#include <type_traits>        // std::invoke_result_t
#include <utility>            // std::forward
#include <vector>             // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- WorkerPool ----------------------------- */

/**
 * @brief FIFO task queue served by a fixed set of threads.
 *
 * Destruction stops accepting work, drains every queued task, then joins.
 */
class WorkerPool {
public:
  /// @param threads Worker count; 0 is treated as 1.
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  /**
   * @brief Queue a callable.
   * @return Future for the callable's result; exceptions propagate through it.
   * @throws std::runtime_error if the pool is shutting down.
   */
  template <class F> auto submit(F&& fn) -> std::future<std::invoke_result_t<F>>;

  [[nodiscard]] std::size_t threadCount() const noexcept { return workers_.size(); }

  /// @brief Tasks queued but not yet started.
  [[nodiscard]] std::size_t pending() const;

private:
  void workerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_{false};
};

template <class F> auto WorkerPool::submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
  using Result = std::invoke_result_t<F>;

  auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
  std::future<Result> future = task->get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      throw std::runtime_error("submit on stopped WorkerPool");
    }
    tasks_.emplace([task]() { (*task)(); });
  }
  cv_.notify_one();
  return future;
}

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_WORKER_POOL_HPP
