#ifndef GPUINFO_GPU_DRM_SYSFS_HPP
#define GPUINFO_GPU_DRM_SYSFS_HPP
/**
 * @file DrmSysfs.hpp
 * @brief Shared DRM/hwmon sysfs readers for the AMD and Intel backends.
 * @note Linux-only. Every path is built under a configurable sysfs root so
 *       tests can point the readers at a fake tree.
 */

#include <cstdint>  // std::uint32_t
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace gpuinfo {

namespace gpu {

namespace drm {

/* ----------------------------- Constants ----------------------------- */

/// Default sysfs mount point.
inline constexpr const char* DEFAULT_SYSFS_ROOT = "/sys";

/* ----------------------------- DrmCard ----------------------------- */

/**
 * @brief One DRM card node ("cardN", connectors excluded).
 */
struct DrmCard {
  std::string name;                       ///< "card0"
  std::string cardPath;                   ///< <root>/class/drm/card0
  std::string devicePath;                 ///< <root>/class/drm/card0/device
  std::uint32_t pciVendor{0};             ///< PCI vendor ID
  std::optional<std::uint32_t> pciDevice; ///< PCI device ID
};

/**
 * @brief Enumerate DRM cards whose PCI vendor matches.
 * @param sysRoot Sysfs root (normally "/sys").
 * @param pciVendor Vendor filter (e.g. 0x1002).
 * @return Cards in numeric order (card2 before card10).
 */
[[nodiscard]] std::vector<DrmCard> listCards(const std::string& sysRoot, std::uint32_t pciVendor);

/* ----------------------------- hwmon ----------------------------- */

/// First hwmon temp1_input under the device, converted from millidegrees.
[[nodiscard]] std::optional<double> hwmonTemperatureC(const std::string& devicePath);

/// First hwmon power attribute (e.g. "power1_average"), converted from microwatts.
[[nodiscard]] std::optional<double> hwmonPowerW(const std::string& devicePath,
                                                const std::string& attribute);

/* ----------------------------- Attributes ----------------------------- */

/// Unsigned integer attribute narrowed to 32 bits.
[[nodiscard]] std::optional<std::uint32_t> readUint32(const std::string& path);

/**
 * @brief Parse a pp_dpm_* clock table.
 *
 * Format: one "N: <freq>Mhz" line per level, the active level marked "*".
 *
 * @param text Table contents.
 * @param activeOnly true for the starred level, false for the highest level.
 */
[[nodiscard]] std::optional<std::uint32_t> parseDpmClockMHz(const std::string& text,
                                                            bool activeOnly);

/// Kernel module version from <root>/module/<module>/version.
[[nodiscard]] std::optional<std::string> moduleVersion(const std::string& sysRoot,
                                                       const std::string& module);

} // namespace drm

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_DRM_SYSFS_HPP
