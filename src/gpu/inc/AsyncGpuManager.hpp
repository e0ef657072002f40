#ifndef GPUINFO_GPU_ASYNC_MANAGER_HPP
#define GPUINFO_GPU_ASYNC_MANAGER_HPP
/**
 * @file AsyncGpuManager.hpp
 * @brief Runs GpuManager queries on a WorkerPool.
 * @note The manager and pool must outlive every submitted query.
 */

#include "src/gpu/inc/GpuConfig.hpp"
#include "src/gpu/inc/GpuManager.hpp"
#include "src/gpu/inc/WorkerPool.hpp"

#include <chrono>   // std::chrono::milliseconds
#include <cstddef>  // std::size_t
#include <future>   // std::future
#include <optional> // std::optional
#include <vector>   // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- PendingQuery ----------------------------- */

/**
 * @brief Handle to a query running on the pool.
 *
 * get() waits at most the configured timeout. On expiry it returns TIMEOUT
 * with the sentinel record; the backend call keeps running on its worker and
 * a later get() may still collect the result.
 */
class PendingQuery {
public:
  PendingQuery(std::future<QueryResult> future, std::optional<std::chrono::milliseconds> timeout);

  PendingQuery(PendingQuery&&) noexcept = default;
  PendingQuery& operator=(PendingQuery&&) noexcept = default;
  PendingQuery(const PendingQuery&) = delete;
  PendingQuery& operator=(const PendingQuery&) = delete;

  /// @brief Wait (bounded by the timeout) and return the result.
  [[nodiscard]] QueryResult get();

  /// @brief True when the result is available without blocking.
  [[nodiscard]] bool ready() const;

  /// @brief Block until the query completes, ignoring the timeout.
  void wait() const;

private:
  std::future<QueryResult> future_;
  std::optional<std::chrono::milliseconds> timeout_;
  std::optional<QueryResult> result_;
};

/* ----------------------------- AsyncGpuManager ----------------------------- */

/**
 * @brief Async bridge: submits the synchronous facade operations to a pool.
 */
class AsyncGpuManager {
public:
  AsyncGpuManager(GpuManager& manager, WorkerPool& pool, AsyncOptions options = {});

  /// @brief Primary device snapshot, asynchronously.
  [[nodiscard]] PendingQuery getAsync();

  [[nodiscard]] PendingQuery getGpuCachedAsync(std::size_t index);
  [[nodiscard]] PendingQuery refreshGpuAsync(std::size_t index);

  /**
   * @brief Cached query for every detected device, run as one pool task.
   * @return Future for one result per device, in detection order.
   */
  [[nodiscard]] std::future<std::vector<QueryResult>> getAllAsync();

  /**
   * @brief Refresh a caller-held record on the pool.
   * @return The refreshed record, or the unchanged one with the failure status.
   */
  [[nodiscard]] PendingQuery refreshRecordAsync(DeviceRecord record);

  /// @brief Re-run detection on the pool.
  /// @return Future for the detected device count.
  [[nodiscard]] std::future<std::size_t> detectAllAsync();

  [[nodiscard]] const AsyncOptions& options() const noexcept { return options_; }

private:
  GpuManager& manager_;
  WorkerPool& pool_;
  AsyncOptions options_;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_ASYNC_MANAGER_HPP
