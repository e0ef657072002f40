/**
 * @file DefaultBackends.cpp
 * @brief Default Linux backend registration.
 */

#include "src/gpu/inc/DefaultBackends.hpp"

#include "src/gpu/inc/AmdSysfsBackend.hpp"
#include "src/gpu/inc/IntelSysfsBackend.hpp"
#include "src/gpu/inc/NvidiaSmiBackend.hpp"
#include "src/gpu/inc/NvmlBackend.hpp"

namespace gpuinfo {

namespace gpu {

std::shared_ptr<BackendRegistry> makeDefaultRegistry(const std::string& sysRoot) {
  auto registry = std::make_shared<BackendRegistry>();

  if (NvmlBackend::compiledIn()) {
    registry->registerBackend(VendorId::nvidia(), std::make_shared<NvmlBackend>());
  }
  registry->registerBackend(VendorId::nvidia(), std::make_shared<NvidiaSmiBackend>());
  registry->registerBackend(VendorId::amd(), std::make_shared<AmdSysfsBackend>(sysRoot));
  registry->registerBackend(VendorId::intelGpu(),
                            std::make_shared<IntelSysfsBackend>(sysRoot));

  return registry;
}

} // namespace gpu

} // namespace gpuinfo
