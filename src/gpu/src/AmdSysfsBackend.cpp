/**
 * @file AmdSysfsBackend.cpp
 * @brief amdgpu sysfs telemetry.
 */

#include "src/gpu/inc/AmdSysfsBackend.hpp"

#include "src/helpers/inc/Files.hpp"

#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

using gpuinfo::helpers::files::readLine;
using gpuinfo::helpers::files::readText;
using gpuinfo::helpers::files::readUint64;

AmdSysfsBackend::AmdSysfsBackend(std::string sysRoot) : sysRoot_(std::move(sysRoot)) {}

DeviceRecord AmdSysfsBackend::readCard(const drm::DrmCard& card) const {
  const std::string& DEV = card.devicePath;

  DeviceRecord rec{};
  rec.vendor = VendorId::amd();
  if (auto product = readLine(DEV + "/product_name")) {
    rec.name = std::move(*product);
  } else {
    rec.name = fmt::format("AMD GPU (Device ID: 0x{:04x})", card.pciDevice.value_or(0));
  }
  rec.driverVersion = drm::moduleVersion(sysRoot_, "amdgpu");

  rec.temperatureC = drm::hwmonTemperatureC(DEV);
  rec.powerUsageW = drm::hwmonPowerW(DEV, "power1_average");
  if (!rec.powerUsageW) {
    rec.powerUsageW = drm::hwmonPowerW(DEV, "power1_input");
  }
  rec.powerLimitW = drm::hwmonPowerW(DEV, "power1_cap");

  if (const auto BUSY = readUint64(DEV + "/gpu_busy_percent")) {
    rec.utilizationPercent = static_cast<double>(*BUSY);
  }

  rec.memoryUsedBytes = readUint64(DEV + "/mem_info_vram_used");
  rec.memoryTotalBytes = readUint64(DEV + "/mem_info_vram_total");

  if (const auto SCLK = readText(DEV + "/pp_dpm_sclk")) {
    rec.coreClockMHz = drm::parseDpmClockMHz(*SCLK, true);
    rec.maxClockMHz = drm::parseDpmClockMHz(*SCLK, false);
  }
  if (const auto MCLK = readText(DEV + "/pp_dpm_mclk")) {
    rec.memoryClockMHz = drm::parseDpmClockMHz(*MCLK, true);
  }

  rec.active = true;
  return rec;
}

GpuStatus AmdSysfsBackend::detect(std::vector<DeviceRecord>& out) {
  const auto CARDS = drm::listCards(sysRoot_, PCI_VENDOR_AMD);
  if (CARDS.empty()) {
    spdlog::debug("amd-sysfs: no AMD card under {}", sysRoot_);
    return GpuStatus::DETECTION_FAILED;
  }

  for (const auto& CARD : CARDS) {
    DeviceRecord rec = readCard(CARD);
    spdlog::info("found AMD GPU {} at {}", rec.name.value_or("?"), CARD.name);
    out.push_back(std::move(rec));
  }
  return GpuStatus::OK;
}

GpuStatus AmdSysfsBackend::refresh(DeviceRecord& record) {
  for (const auto& CARD : drm::listCards(sysRoot_, PCI_VENDOR_AMD)) {
    DeviceRecord fresh = readCard(CARD);
    if (fresh == record) {
      record = std::move(fresh);
      return GpuStatus::OK;
    }
  }
  return GpuStatus::DETECTION_FAILED;
}

} // namespace gpu

} // namespace gpuinfo
