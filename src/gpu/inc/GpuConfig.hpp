#ifndef GPUINFO_GPU_CONFIG_HPP
#define GPUINFO_GPU_CONFIG_HPP
/**
 * @file GpuConfig.hpp
 * @brief Construction-time configuration for the manager and async bridge.
 *
 * Environment overrides (invalid, out-of-range or missing values keep the
 * defaults):
 *  - GPUINFO_CACHE_TTL_MS       : cache TTL in milliseconds
 *  - GPUINFO_CACHE_MAX_ENTRIES  : LRU bound (0 disables caching)
 *  - GPUINFO_ASYNC_THREADS      : worker pool size
 *  - GPUINFO_ASYNC_TIMEOUT_MS   : async query timeout
 */

#include "src/gpu/inc/ResultCache.hpp"

#include <chrono>   // std::chrono::milliseconds
#include <cstddef>  // std::size_t
#include <optional> // std::optional
#include <string>   // std::string

namespace gpuinfo {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::size_t DEFAULT_ASYNC_THREADS = 2;

/// Longest duration accepted for a TTL or timeout setting (one year).
inline constexpr std::chrono::milliseconds MAX_CONFIG_DURATION = std::chrono::hours(24 * 365);

inline constexpr const char* ENV_CACHE_TTL_MS = "GPUINFO_CACHE_TTL_MS";
inline constexpr const char* ENV_CACHE_MAX_ENTRIES = "GPUINFO_CACHE_MAX_ENTRIES";
inline constexpr const char* ENV_ASYNC_THREADS = "GPUINFO_ASYNC_THREADS";
inline constexpr const char* ENV_ASYNC_TIMEOUT_MS = "GPUINFO_ASYNC_TIMEOUT_MS";

/* ----------------------------- AsyncOptions ----------------------------- */

/**
 * @brief Async bridge settings.
 */
struct AsyncOptions {
  std::size_t threads{DEFAULT_ASYNC_THREADS};       ///< Worker pool size
  std::optional<std::chrono::milliseconds> timeout; ///< Wait bound; absent = wait forever
};

/* ----------------------------- ManagerConfig ----------------------------- */

/**
 * @brief Complete configuration for one manager instance.
 */
struct ManagerConfig {
  CacheConfig cache{};
  AsyncOptions async{};

  /// @brief Defaults overridden by GPUINFO_* environment variables.
  [[nodiscard]] static ManagerConfig fromEnvironment();

  /// @note Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_CONFIG_HPP
