#ifndef GPUINFO_GPU_AMD_SYSFS_BACKEND_HPP
#define GPUINFO_GPU_AMD_SYSFS_BACKEND_HPP
/**
 * @file AmdSysfsBackend.hpp
 * @brief AMD (amdgpu) backend reading DRM sysfs and hwmon.
 * @note Linux-only. Stateless apart from the sysfs root; safe to share.
 */

#include "src/gpu/inc/DrmSysfs.hpp"
#include "src/gpu/inc/GpuBackend.hpp"

#include <string> // std::string
#include <vector> // std::vector

namespace gpuinfo {

namespace gpu {

/**
 * @brief amdgpu backend.
 *
 * Sources under <root>/class/drm/cardN/device:
 *  - product_name, vendor, device
 *  - hwmon/hwmonK/temp1_input (millidegrees C)
 *  - hwmon/hwmonK/power1_average, power1_cap (microwatts)
 *  - gpu_busy_percent
 *  - mem_info_vram_used, mem_info_vram_total (bytes)
 *  - pp_dpm_sclk, pp_dpm_mclk (starred active level)
 * Driver version from <root>/module/amdgpu/version.
 */
class AmdSysfsBackend final : public GpuBackend {
public:
  explicit AmdSysfsBackend(std::string sysRoot = drm::DEFAULT_SYSFS_ROOT);

  [[nodiscard]] VendorId vendor() const noexcept override { return VendorId::amd(); }
  [[nodiscard]] const char* name() const noexcept override { return "amd-sysfs"; }

  /// @return DETECTION_FAILED when no AMD card is present.
  [[nodiscard]] GpuStatus detect(std::vector<DeviceRecord>& out) override;

  /// @return DETECTION_FAILED when no card with the record's name remains.
  [[nodiscard]] GpuStatus refresh(DeviceRecord& record) override;

private:
  [[nodiscard]] DeviceRecord readCard(const drm::DrmCard& card) const;

  std::string sysRoot_;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_AMD_SYSFS_BACKEND_HPP
