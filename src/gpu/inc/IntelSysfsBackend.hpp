#ifndef GPUINFO_GPU_INTEL_SYSFS_BACKEND_HPP
#define GPUINFO_GPU_INTEL_SYSFS_BACKEND_HPP
/**
 * @file IntelSysfsBackend.hpp
 * @brief Intel (i915/xe) backend reading DRM sysfs.
 * @note Linux-only. Stateless apart from the sysfs root; safe to share.
 */

#include "src/gpu/inc/DrmSysfs.hpp"
#include "src/gpu/inc/GpuBackend.hpp"

#include <string> // std::string
#include <vector> // std::vector

namespace gpuinfo {

namespace gpu {

/**
 * @brief Intel GPU backend.
 *
 * Reports the Intel subkind from the device name (discrete for Arc class
 * parts, integrated otherwise). Clocks come from gt_cur_freq_mhz /
 * gt_max_freq_mhz on the card node; discrete parts may also expose hwmon
 * temperature and a power limit.
 */
class IntelSysfsBackend final : public GpuBackend {
public:
  explicit IntelSysfsBackend(std::string sysRoot = drm::DEFAULT_SYSFS_ROOT);

  [[nodiscard]] VendorId vendor() const noexcept override { return VendorId::intelGpu(); }
  [[nodiscard]] const char* name() const noexcept override { return "intel-sysfs"; }

  /// @return DETECTION_FAILED when no Intel card is present.
  [[nodiscard]] GpuStatus detect(std::vector<DeviceRecord>& out) override;

  /// @return DETECTION_FAILED when no card with the record's identity remains.
  [[nodiscard]] GpuStatus refresh(DeviceRecord& record) override;

private:
  [[nodiscard]] DeviceRecord readCard(const drm::DrmCard& card) const;

  std::string sysRoot_;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_INTEL_SYSFS_BACKEND_HPP
