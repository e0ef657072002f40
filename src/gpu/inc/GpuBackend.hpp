#ifndef GPUINFO_GPU_BACKEND_HPP
#define GPUINFO_GPU_BACKEND_HPP
/**
 * @file GpuBackend.hpp
 * @brief Polymorphic vendor detection backend.
 * @note Implementations must be safe to call concurrently from worker threads.
 */

#include "src/gpu/inc/DeviceRecord.hpp"
#include "src/gpu/inc/GpuStatus.hpp"
#include "src/gpu/inc/GpuVendor.hpp"

#include <vector> // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- GpuBackend ----------------------------- */

/**
 * @brief Capability contract for one vendor/platform detection source.
 *
 * Backends are opaque to the rest of the system: the registry only sees
 * detect() and refresh() results. They report failure through GpuStatus and
 * are held by std::shared_ptr so an in-flight query keeps them alive.
 */
class GpuBackend {
public:
  virtual ~GpuBackend() = default;

  /// @brief Vendor this backend serves.
  [[nodiscard]] virtual VendorId vendor() const noexcept = 0;

  /// @brief Short backend name for logs (e.g. "nvml", "amd-sysfs").
  [[nodiscard]] virtual const char* name() const noexcept = 0;

  /**
   * @brief Enumerate every device this backend can see.
   * @param out Appended with one record per device.
   * @return OK, or DETECTION_FAILED when the source is unavailable.
   */
  [[nodiscard]] virtual GpuStatus detect(std::vector<DeviceRecord>& out) = 0;

  /**
   * @brief Re-read live metrics for a previously detected device.
   * @param record Updated in place on success; untouched on failure.
   * @return OK, or DETECTION_FAILED.
   */
  [[nodiscard]] virtual GpuStatus refresh(DeviceRecord& record) = 0;

protected:
  GpuBackend() = default;
  GpuBackend(const GpuBackend&) = default;
  GpuBackend& operator=(const GpuBackend&) = default;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_BACKEND_HPP
