#ifndef GPUINFO_GPU_MANAGER_HPP
#define GPUINFO_GPU_MANAGER_HPP
/**
 * @file GpuManager.hpp
 * @brief Synchronous dispatch facade: cache lookup, backend refresh, store update.
 * @note Thread-safe: Queries may run concurrently from any thread. Backend
 *       calls run on the caller's thread with no internal timeout.
 */

#include "src/gpu/inc/BackendRegistry.hpp"
#include "src/gpu/inc/DeviceRecord.hpp"
#include "src/gpu/inc/DeviceStore.hpp"
#include "src/gpu/inc/GpuQuery.hpp"
#include "src/gpu/inc/GpuStatus.hpp"
#include "src/gpu/inc/GpuVendor.hpp"
#include "src/gpu/inc/ResultCache.hpp"

#include <chrono>   // std::chrono::milliseconds
#include <cstddef>  // std::size_t
#include <memory>   // std::shared_ptr
#include <mutex>    // std::mutex
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- QueryResult ----------------------------- */

/**
 * @brief Outcome of a device query.
 *
 * On a failed refresh, snapshot holds the last known record (not cached) and
 * status carries the failure. On NOT_FOUND, snapshot is null.
 */
struct QueryResult {
  std::shared_ptr<const DeviceRecord> snapshot; ///< Shared immutable record
  GpuStatus status{GpuStatus::OK};              ///< Outcome
  bool fromCache{false};                        ///< True on a cache hit

  [[nodiscard]] bool ok() const noexcept { return status == GpuStatus::OK; }
};

/* ----------------------------- GpuStatistics ----------------------------- */

/**
 * @brief Aggregate view of the detected devices.
 */
struct GpuStatistics {
  std::size_t totalGpus{0};
  std::size_t nvidiaCount{0};
  std::size_t amdCount{0};
  std::size_t intelCount{0};
  std::size_t unknownCount{0};
  std::size_t activeCount{0};

  double totalTemperatureC{0.0};
  std::size_t temperatureReadings{0};
  double totalPowerW{0.0};
  std::size_t powerReadings{0};

  /// @brief Mean temperature over devices reporting one.
  [[nodiscard]] std::optional<double> averageTemperatureC() const noexcept;

  /// @brief Summed power draw over devices reporting one.
  [[nodiscard]] std::optional<double> totalPowerConsumptionW() const noexcept;

  /// @note Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- GpuManager ----------------------------- */

/**
 * @brief Entry point for GPU queries.
 *
 * Per-query flow: cache lookup; on miss, read the stored record (detecting
 * the full collection first if nothing has been detected yet), refresh it
 * through the registry, store and cache the result. Snapshots are cached only
 * under the key that was requested, and only when no detection or primary
 * change replaced the slot while the backend call was in flight.
 */
class GpuManager {
public:
  /**
   * @brief Construct a manager.
   * @param registry Backends to dispatch to (shared).
   * @param cacheConfig Cache policy, fixed for the manager's lifetime.
   * @param clock Cache time source; defaults to steady_clock.
   */
  explicit GpuManager(std::shared_ptr<BackendRegistry> registry, CacheConfig cacheConfig = {},
                      ResultCache::ClockFn clock = {});

  /**
   * @brief Construct a manager with an explicit cache policy.
   * @param maxEntries LRU bound; nullopt for TTL-only.
   */
  [[nodiscard]] static GpuManager withCacheConfig(std::shared_ptr<BackendRegistry> registry,
                                                  std::chrono::milliseconds ttl,
                                                  std::optional<std::size_t> maxEntries);

  GpuManager(const GpuManager&) = delete;
  GpuManager& operator=(const GpuManager&) = delete;

  /* --------------------------- Cached queries --------------------------- */

  /**
   * @brief Cached query for one device.
   * @return Snapshot and status; NOT_FOUND when index is out of range.
   */
  [[nodiscard]] QueryResult getGpuCached(std::size_t index);

  /**
   * @brief Cached query for the primary device.
   * @return The sentinel record (status OK, not cached) when no device was detected.
   */
  [[nodiscard]] QueryResult getPrimaryGpuCached();

  /// @brief Primary device snapshot; never null.
  [[nodiscard]] std::shared_ptr<const DeviceRecord> get();

  [[nodiscard]] CacheStats getCacheStats() const;
  [[nodiscard]] const CacheConfig& cacheConfig() const noexcept { return cache_.config(); }

  /* --------------------------- Explicit refresh --------------------------- */

  /// @brief Re-run detection, replace the collection and clear the cache.
  /// @return Number of devices detected.
  std::size_t detectAll();

  /// @brief Drop the cached entry for index (and primary if it is primary) and refresh it.
  QueryResult refreshGpu(std::size_t index);

  /**
   * @brief refreshGpu() for the current primary device.
   * @return NOT_FOUND with no snapshot when no device was detected.
   */
  QueryResult refreshPrimaryGpu();

  /**
   * @brief Refresh a caller-held record through the registry.
   *
   * The store and cache are not touched. On failure record is unchanged.
   */
  GpuStatus refreshRecord(DeviceRecord& record);

  /**
   * @brief Refresh every device and clear the cache.
   * @return OK, or the first failure (every device is still attempted).
   */
  GpuStatus refreshAll();

  /* --------------------------- Collection view --------------------------- */

  [[nodiscard]] std::size_t gpuCount();
  [[nodiscard]] std::vector<DeviceRecord> allGpus();
  [[nodiscard]] std::optional<DeviceRecord> gpuByIndex(std::size_t index);
  [[nodiscard]] std::vector<DeviceRecord> gpusByVendor(const VendorId& vendor);
  [[nodiscard]] std::size_t primaryIndex();

  /// @return OK, or NOT_FOUND when index is out of range.
  GpuStatus setPrimaryGpu(std::size_t index);

  [[nodiscard]] GpuStatistics statistics();
  [[nodiscard]] std::vector<std::size_t> activeGpuIndices();

  /// @brief True when every device reports active == true (false when none detected).
  [[nodiscard]] bool allGpusActive();

  [[nodiscard]] GpuQuery query();

  [[nodiscard]] const BackendRegistry& registry() const noexcept { return *registry_; }

private:
  /// Detect once if nothing has been stored yet.
  void ensureDetected();

  /// Miss path: refresh the stored record and cache it under key.
  QueryResult refreshInto(const CacheKey& key, std::optional<StoredRecord> current);

  std::shared_ptr<BackendRegistry> registry_;
  ResultCache cache_;
  DeviceStore store_;
  std::mutex detectMutex_;
  std::mutex publishMutex_; ///< Orders store+cache writes against collection changes
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_MANAGER_HPP
