#ifndef GPUINFO_GPU_DEVICE_RECORD_HPP
#define GPUINFO_GPU_DEVICE_RECORD_HPP
/**
 * @file DeviceRecord.hpp
 * @brief Point-in-time GPU telemetry record.
 * @note Every metric is optional: absent means unsupported, not zero.
 */

#include "src/gpu/inc/GpuVendor.hpp"

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint32_t, std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string

namespace gpuinfo {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// Plausible temperature range for validation (Celsius).
inline constexpr double MIN_PLAUSIBLE_TEMP_C = -50.0;
inline constexpr double MAX_PLAUSIBLE_TEMP_C = 150.0;

/* ----------------------------- DeviceRecord ----------------------------- */

/**
 * @brief Telemetry snapshot for one GPU.
 *
 * Identity is (vendor, name): operator== and DeviceIdentityHash ignore every
 * metric so a refreshed record still matches its previous snapshot. Use
 * sameSnapshot() for a full comparison.
 */
struct DeviceRecord {
  VendorId vendor{};                        ///< Vendor identity
  std::optional<std::string> name;          ///< Marketing name
  std::optional<std::string> driverVersion; ///< Driver version string

  std::optional<double> temperatureC;       ///< GPU temperature (Celsius)
  std::optional<double> utilizationPercent; ///< GPU utilization (0-100)

  std::optional<std::uint32_t> coreClockMHz;   ///< Current core clock
  std::optional<std::uint32_t> memoryClockMHz; ///< Current memory clock
  std::optional<std::uint32_t> maxClockMHz;    ///< Maximum core clock

  std::optional<double> powerUsageW; ///< Current power draw (Watts)
  std::optional<double> powerLimitW; ///< Power limit (Watts)

  std::optional<std::uint64_t> memoryUsedBytes;  ///< VRAM in use
  std::optional<std::uint64_t> memoryTotalBytes; ///< Total VRAM

  std::optional<bool> active; ///< Device is powered and usable

  /// @brief Sentinel record: vendor Unknown, every other field absent.
  [[nodiscard]] static DeviceRecord unknown() { return DeviceRecord{}; }

  /// @brief True for the sentinel record.
  [[nodiscard]] bool isUnknown() const noexcept;

  /**
   * @brief Plausibility check.
   * @return true when the vendor is known or a name is present, and every
   *         present metric lies in a sane range.
   */
  [[nodiscard]] bool isValid() const noexcept;

  /// @brief Memory used / total as a percentage, when both are present.
  [[nodiscard]] std::optional<double> memoryUtilizationPercent() const noexcept;

  /// @brief Human-readable one-line summary ("N/A" for absent fields).
  /// @note Allocates for string building.
  [[nodiscard]] std::string toString() const;

  /// @brief JSON object; absent fields are null.
  /// @note Allocates for string building.
  [[nodiscard]] std::string toJson() const;

  /// Identity comparison: vendor and name only.
  friend bool operator==(const DeviceRecord& a, const DeviceRecord& b) noexcept {
    return a.vendor == b.vendor && a.name == b.name;
  }
};

/// Full field-by-field comparison.
[[nodiscard]] bool sameSnapshot(const DeviceRecord& a, const DeviceRecord& b) noexcept;

/**
 * @brief Hash over (vendor, name), consistent with DeviceRecord::operator==.
 */
struct DeviceIdentityHash {
  [[nodiscard]] std::size_t operator()(const DeviceRecord& record) const noexcept;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_DEVICE_RECORD_HPP
