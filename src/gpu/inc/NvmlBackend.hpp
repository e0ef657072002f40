#ifndef GPUINFO_GPU_NVML_BACKEND_HPP
#define GPUINFO_GPU_NVML_BACKEND_HPP
/**
 * @file NvmlBackend.hpp
 * @brief NVIDIA backend using NVML.
 * @note Each call opens its own NVML session, so one instance is safe to
 *       share across threads. Without NVML at build time every call returns
 *       DETECTION_FAILED.
 */

#include "src/gpu/inc/GpuBackend.hpp"

#include <vector> // std::vector

namespace gpuinfo {

namespace gpu {

class NvmlBackend final : public GpuBackend {
public:
  NvmlBackend() = default;

  [[nodiscard]] VendorId vendor() const noexcept override { return VendorId::nvidia(); }
  [[nodiscard]] const char* name() const noexcept override { return "nvml"; }

  /// @return DETECTION_FAILED when NVML cannot initialize or reports no device.
  [[nodiscard]] GpuStatus detect(std::vector<DeviceRecord>& out) override;

  /// @return DETECTION_FAILED when no device with the record's name is found.
  [[nodiscard]] GpuStatus refresh(DeviceRecord& record) override;

  /// @brief True when the library was built against NVML.
  [[nodiscard]] static bool compiledIn() noexcept;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_NVML_BACKEND_HPP
