#ifndef GPUINFO_GPU_RESULT_CACHE_HPP
#define GPUINFO_GPU_RESULT_CACHE_HPP
/**
 * @file ResultCache.hpp
 * @brief TTL + LRU cache of immutable device snapshots.
 * @note Thread-safe: Readers share a std::shared_mutex; entries are swapped
 *       whole under the exclusive lock so a reader sees either the old or the
 *       new entry, never a mix.
 */

#include "src/gpu/inc/DeviceRecord.hpp"

#include <atomic>        // std::atomic
#include <chrono>        // std::chrono
#include <cstddef>       // std::size_t
#include <cstdint>       // std::uint64_t
#include <functional>    // std::function
#include <limits>        // std::numeric_limits
#include <memory>        // std::shared_ptr
#include <optional>      // std::optional
#include <shared_mutex>  // std::shared_mutex
#include <string>        // std::string
#include <unordered_map> // std::unordered_map

namespace gpuinfo {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// Default time-to-live for cached snapshots.
inline constexpr std::chrono::milliseconds DEFAULT_CACHE_TTL{500};

/// Longest TTL the cache honors; larger values are clamped to it.
inline constexpr std::chrono::milliseconds MAX_CACHE_TTL =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::duration::max());

/* ----------------------------- CacheKey ----------------------------- */

/**
 * @brief Cache key: a device index or the primary-device sentinel.
 */
struct CacheKey {
  static constexpr std::size_t PRIMARY_SENTINEL = std::numeric_limits<std::size_t>::max();

  std::size_t value{PRIMARY_SENTINEL};

  [[nodiscard]] static constexpr CacheKey device(std::size_t index) noexcept { return {index}; }
  [[nodiscard]] static constexpr CacheKey primary() noexcept { return {PRIMARY_SENTINEL}; }

  [[nodiscard]] constexpr bool isPrimary() const noexcept { return value == PRIMARY_SENTINEL; }

  /// @brief "primary" or "gpu<N>".
  [[nodiscard]] std::string toString() const;

  friend constexpr bool operator==(const CacheKey& a, const CacheKey& b) noexcept {
    return a.value == b.value;
  }
};

struct CacheKeyHash {
  [[nodiscard]] std::size_t operator()(const CacheKey& key) const noexcept {
    return std::hash<std::size_t>{}(key.value);
  }
};

/* ----------------------------- CacheConfig ----------------------------- */

/**
 * @brief Cache policy. Fixed for the lifetime of a cache.
 */
struct CacheConfig {
  std::chrono::milliseconds ttl{DEFAULT_CACHE_TTL}; ///< Maximum entry age
  std::optional<std::size_t> maxEntries;            ///< LRU bound; absent = TTL only
};

/* ----------------------------- CacheStats ----------------------------- */

/**
 * @brief Aggregate cache statistics, computed on demand.
 */
struct CacheStats {
  std::size_t totalEntries{0};                             ///< Entries held (including expired)
  std::uint64_t totalAccesses{0};                          ///< Sum of per-entry hit counts
  std::optional<std::chrono::milliseconds> oldestEntryAge; ///< Age of the oldest entry

  /// @note Allocates for string building.
  [[nodiscard]] std::string toString() const;

  /// @note Allocates for string building.
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- CacheEntry ----------------------------- */

/**
 * @brief One cached snapshot with its access bookkeeping.
 *
 * The snapshot never changes after construction. Access bookkeeping is
 * atomic so concurrent readers can update it under the shared lock.
 */
class CacheEntry {
public:
  using Clock = std::chrono::steady_clock;

  CacheEntry(std::shared_ptr<const DeviceRecord> snapshot, Clock::time_point createdAt,
             std::uint64_t sequence) noexcept;

  [[nodiscard]] const std::shared_ptr<const DeviceRecord>& snapshot() const noexcept {
    return snapshot_;
  }
  [[nodiscard]] Clock::time_point createdAt() const noexcept { return createdAt_; }
  [[nodiscard]] Clock::time_point lastAccessedAt() const noexcept;
  [[nodiscard]] std::uint64_t accessCount() const noexcept;
  [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }

  /// @brief True when the entry is younger than ttl at `now`.
  [[nodiscard]] bool isFresh(Clock::time_point now, std::chrono::milliseconds ttl) const noexcept {
    return now - createdAt_ < ttl;
  }

  /// @brief Record a hit.
  void touch(Clock::time_point now) const noexcept;

private:
  std::shared_ptr<const DeviceRecord> snapshot_;
  Clock::time_point createdAt_;
  std::uint64_t sequence_;
  mutable std::atomic<Clock::rep> lastAccessedTicks_;
  mutable std::atomic<std::uint64_t> accessCount_{0};
};

/* ----------------------------- ResultCache ----------------------------- */

/**
 * @brief Keyed cache of device snapshots with TTL expiry and optional LRU bound.
 *
 * Expired entries are treated as absent and removed lazily. When maxEntries
 * is set, inserting a new key into a full cache evicts the entry with the
 * oldest lastAccessedAt, ties broken by lowest accessCount, then by earliest
 * insertion. A maxEntries of 0 disables storage entirely.
 */
class ResultCache {
public:
  using Clock = CacheEntry::Clock;
  using ClockFn = std::function<Clock::time_point()>;

  /**
   * @brief Construct a cache.
   * @param config Policy. A TTL above MAX_CACHE_TTL is clamped, a negative one
   *        is treated as zero.
   * @param clock Time source; defaults to steady_clock::now.
   */
  explicit ResultCache(CacheConfig config = {}, ClockFn clock = {});

  ResultCache(const ResultCache&) = delete;
  ResultCache& operator=(const ResultCache&) = delete;

  /**
   * @brief Look up a fresh snapshot.
   * @return Snapshot on hit; nullptr when absent or expired.
   */
  [[nodiscard]] std::shared_ptr<const DeviceRecord> get(const CacheKey& key) const;

  /**
   * @brief Insert or replace the entry for key.
   * @return The stored snapshot (also returned when the cache is disabled).
   */
  std::shared_ptr<const DeviceRecord> put(const CacheKey& key, DeviceRecord record);

  /// @brief Remove one entry.
  void invalidate(const CacheKey& key);

  /// @brief Remove every entry.
  void clear();

  [[nodiscard]] CacheStats stats() const;

  /// @brief Entries held, including expired ones not yet evicted.
  [[nodiscard]] std::size_t size() const;

  /// @brief True if an entry exists for key, fresh or not.
  [[nodiscard]] bool contains(const CacheKey& key) const;

  [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

private:
  using EntryPtr = std::shared_ptr<const CacheEntry>;

  /// Evict one entry by LRU order. Caller holds the exclusive lock.
  void evictOneLocked();

  const CacheConfig config_;
  const ClockFn clock_;

  mutable std::shared_mutex mutex_;
  mutable std::unordered_map<CacheKey, EntryPtr, CacheKeyHash> entries_;
  std::uint64_t nextSequence_{0};
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_RESULT_CACHE_HPP
