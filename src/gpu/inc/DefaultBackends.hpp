#ifndef GPUINFO_GPU_DEFAULT_BACKENDS_HPP
#define GPUINFO_GPU_DEFAULT_BACKENDS_HPP
/**
 * @file DefaultBackends.hpp
 * @brief Registry pre-populated with the Linux backends.
 */

#include "src/gpu/inc/BackendRegistry.hpp"
#include "src/gpu/inc/DrmSysfs.hpp"

#include <memory> // std::shared_ptr
#include <string> // std::string

namespace gpuinfo {

namespace gpu {

/**
 * @brief Build the default registry.
 *
 * Registration (and fallback) order: NVML (when compiled in), nvidia-smi,
 * AMD sysfs, Intel sysfs.
 *
 * @param sysRoot Sysfs root for the sysfs backends.
 */
[[nodiscard]] std::shared_ptr<BackendRegistry>
makeDefaultRegistry(const std::string& sysRoot = drm::DEFAULT_SYSFS_ROOT);

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_DEFAULT_BACKENDS_HPP
