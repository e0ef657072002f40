/**
 * @file NvmlBackend.cpp
 * @brief NVIDIA telemetry via NVML.
 */

#include "src/gpu/inc/NvmlBackend.hpp"

#include <array>   // std::array
#include <utility> // std::move

#include <spdlog/spdlog.h>

#include "src/gpu/inc/compat_nvml_detect.hpp"

namespace gpuinfo {

namespace gpu {

namespace {

#if COMPAT_NVML_AVAILABLE

/// RAII wrapper for NVML initialization.
class NvmlSession {
public:
  NvmlSession() noexcept : initialized_(nvmlInit_v2() == NVML_SUCCESS) {}
  ~NvmlSession() {
    if (initialized_)
      nvmlShutdown();
  }

  [[nodiscard]] bool valid() const noexcept { return initialized_; }

  NvmlSession(const NvmlSession&) = delete;
  NvmlSession& operator=(const NvmlSession&) = delete;

private:
  bool initialized_;
};

/// System driver version, if NVML reports one.
std::optional<std::string> queryDriverVersion() {
  std::array<char, NVML_SYSTEM_DRIVER_VERSION_BUFFER_SIZE> buf{};
  if (nvmlSystemGetDriverVersion(buf.data(), static_cast<unsigned int>(buf.size())) !=
      NVML_SUCCESS) {
    return std::nullopt;
  }
  return std::string(buf.data());
}

/// Build a record for one device handle. Unsupported queries leave fields absent.
DeviceRecord queryDevice(nvmlDevice_t device, const std::optional<std::string>& driver) {
  DeviceRecord rec{};
  rec.vendor = VendorId::nvidia();
  rec.driverVersion = driver;

  std::array<char, NVML_DEVICE_NAME_BUFFER_SIZE> name{};
  if (nvmlDeviceGetName(device, name.data(), static_cast<unsigned int>(name.size())) ==
      NVML_SUCCESS) {
    rec.name = std::string(name.data());
  }

  // Temperature
#if COMPAT_NVML_API_VERSION >= 13
  nvmlTemperature_t tempQuery{};
  tempQuery.version = nvmlTemperature_v1;
  tempQuery.sensorType = NVML_TEMPERATURE_GPU;
  if (nvmlDeviceGetTemperatureV(device, &tempQuery) == NVML_SUCCESS) {
    rec.temperatureC = static_cast<double>(tempQuery.temperature);
  }
#else
  unsigned int temp = 0;
  if (nvmlDeviceGetTemperature(device, NVML_TEMPERATURE_GPU, &temp) == NVML_SUCCESS) {
    rec.temperatureC = static_cast<double>(temp);
  }
#endif

  // Utilization
  nvmlUtilization_t util{};
  if (nvmlDeviceGetUtilizationRates(device, &util) == NVML_SUCCESS) {
    rec.utilizationPercent = static_cast<double>(util.gpu);
  }

  // Clocks
  unsigned int clock = 0;
  if (nvmlDeviceGetClockInfo(device, NVML_CLOCK_GRAPHICS, &clock) == NVML_SUCCESS) {
    rec.coreClockMHz = clock;
  }
  if (nvmlDeviceGetClockInfo(device, NVML_CLOCK_MEM, &clock) == NVML_SUCCESS) {
    rec.memoryClockMHz = clock;
  }
  if (nvmlDeviceGetMaxClockInfo(device, NVML_CLOCK_GRAPHICS, &clock) == NVML_SUCCESS) {
    rec.maxClockMHz = clock;
  }

  // Power (milliwatts)
  unsigned int power = 0;
  if (nvmlDeviceGetPowerUsage(device, &power) == NVML_SUCCESS) {
    rec.powerUsageW = static_cast<double>(power) / 1000.0;
  }
  if (nvmlDeviceGetEnforcedPowerLimit(device, &power) == NVML_SUCCESS) {
    rec.powerLimitW = static_cast<double>(power) / 1000.0;
  }

  // Memory
  nvmlMemory_t mem{};
  if (nvmlDeviceGetMemoryInfo(device, &mem) == NVML_SUCCESS) {
    rec.memoryUsedBytes = static_cast<std::uint64_t>(mem.used);
    rec.memoryTotalBytes = static_cast<std::uint64_t>(mem.total);
  }

  rec.active = true;
  return rec;
}

/// Enumerate every device in an open session.
std::vector<DeviceRecord> queryAll() {
  std::vector<DeviceRecord> result;

  unsigned int count = 0;
  if (nvmlDeviceGetCount_v2(&count) != NVML_SUCCESS) {
    return result;
  }

  const auto DRIVER = queryDriverVersion();
  result.reserve(count);
  for (unsigned int i = 0; i < count; ++i) {
    nvmlDevice_t device{};
    if (nvmlDeviceGetHandleByIndex_v2(i, &device) == NVML_SUCCESS) {
      result.push_back(queryDevice(device, DRIVER));
    }
  }
  return result;
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace

bool NvmlBackend::compiledIn() noexcept { return COMPAT_NVML_AVAILABLE != 0; }

GpuStatus NvmlBackend::detect(std::vector<DeviceRecord>& out) {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    spdlog::debug("nvml: initialization failed");
    return GpuStatus::DETECTION_FAILED;
  }

  auto devices = queryAll();
  if (devices.empty()) {
    return GpuStatus::DETECTION_FAILED;
  }
  for (auto& rec : devices) {
    spdlog::info("found NVIDIA GPU {} via NVML", rec.name.value_or("?"));
    out.push_back(std::move(rec));
  }
  return GpuStatus::OK;
#else
  (void)out;
  spdlog::debug("nvml: not compiled in");
  return GpuStatus::DETECTION_FAILED;
#endif
}

GpuStatus NvmlBackend::refresh(DeviceRecord& record) {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return GpuStatus::DETECTION_FAILED;
  }

  for (auto& rec : queryAll()) {
    if (rec == record) {
      record = std::move(rec);
      return GpuStatus::OK;
    }
  }
  return GpuStatus::DETECTION_FAILED;
#else
  (void)record;
  return GpuStatus::DETECTION_FAILED;
#endif
}

} // namespace gpu

} // namespace gpuinfo
