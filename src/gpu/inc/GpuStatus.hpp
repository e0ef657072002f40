#ifndef GPUINFO_GPU_STATUS_HPP
#define GPUINFO_GPU_STATUS_HPP
/**
 * @file GpuStatus.hpp
 * @brief Status codes returned by backends, the registry and the manager.
 */

#include <cstdint> // std::uint8_t

namespace gpuinfo {

namespace gpu {

/* ----------------------------- GpuStatus ----------------------------- */

/**
 * @brief Status codes for GPU detection and query operations.
 *
 * A cache miss is not a status: it is the normal trigger for a refresh.
 */
enum class GpuStatus : std::uint8_t {
  OK = 0,
  NO_BACKEND,       ///< No backend registered for the record's vendor
  DETECTION_FAILED, ///< Backend query failed (driver absent, permission, device vanished)
  NOT_FOUND,        ///< Device index out of range
  INVALID_ARGUMENT, ///< Caller passed an unusable argument (e.g. null backend)
  TIMEOUT,          ///< Asynchronous query exceeded the configured timeout
};

/**
 * @brief Human-readable status string.
 * @note Returns a static string pointer.
 */
[[nodiscard]] const char* toString(GpuStatus status) noexcept;

/// @brief Check for GpuStatus::OK.
[[nodiscard]] constexpr bool isOk(GpuStatus status) noexcept { return status == GpuStatus::OK; }

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_STATUS_HPP
